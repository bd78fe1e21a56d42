// ─────────────────────────────────────────────────────────────────────────────
// JsonReader Tests
// ─────────────────────────────────────────────────────────────────────────────
// simdjson parsing with conversion to nlohmann::json.

#include <catch2/catch_test_macros.hpp>

#include "hubpp/json/json_reader.hpp"

#include <cstdint>
#include <string>

using namespace hubpp;

TEST_CASE("JsonReader converts every value kind", "[json]") {
    JsonReader reader;
    auto doc = reader.read(R"({"s":"text","i":-3,"u":18446744073709551615,"d":1.5,"b":true,"n":null,"a":[1,"two"],"o":{"k":"v"}})");

    REQUIRE(doc.has_value());
    REQUIRE((*doc)["s"] == "text");
    REQUIRE((*doc)["i"] == -3);
    REQUIRE((*doc)["u"].get<std::uint64_t>() == 18446744073709551615ULL);
    REQUIRE((*doc)["d"] == 1.5);
    REQUIRE((*doc)["b"] == true);
    REQUIRE((*doc)["n"].is_null());
    REQUIRE((*doc)["a"] == Json::array({1, "two"}));
    REQUIRE((*doc)["o"]["k"] == "v");
}

TEST_CASE("JsonReader reports malformed input as ParseError", "[json]") {
    JsonReader reader;

    auto truncated = reader.read(R"({"type":1,)");
    REQUIRE(truncated.has_value() == false);
    REQUIRE(truncated.error().code == HubError::Code::ParseError);
    REQUIRE(truncated.error().message.find("Invalid JSON") != std::string::npos);

    auto empty = reader.read("");
    REQUIRE(empty.has_value() == false);
    REQUIRE(empty.error().code == HubError::Code::ParseError);
}

TEST_CASE("JsonReader enforces the nesting limit", "[json]") {
    JsonReaderConfig config;
    config.max_depth = 3;
    JsonReader reader(config);

    REQUIRE(reader.read("[[[1]]]").has_value());

    auto too_deep = reader.read("[[[[[1]]]]]");
    REQUIRE(too_deep.has_value() == false);
    REQUIRE(too_deep.error().code == HubError::Code::ParseError);
    REQUIRE(too_deep.error().message.find("nesting") != std::string::npos);
}

TEST_CASE("JsonReader can be reused", "[json]") {
    JsonReader reader;

    auto first = reader.read(R"({"type":6})");
    auto second = reader.read(R"({"type":7,"allowReconnect":true})");

    REQUIRE((*first)["type"] == 6);
    REQUIRE((*second)["type"] == 7);
    REQUIRE((*second)["allowReconnect"] == true);
}

TEST_CASE("read_json uses the default reader", "[json]") {
    auto doc = read_json(R"({"connectionId":"abc"})");

    REQUIRE(doc.has_value());
    REQUIRE((*doc)["connectionId"] == "abc");
    REQUIRE(read_json("nope").has_value() == false);
}
