#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// JsonReader - simdjson in, nlohmann::json out
// ─────────────────────────────────────────────────────────────────────────────
// Incoming text (negotiate bodies, hub frames) is parsed with the simdjson DOM
// parser and converted to nlohmann::json, which the message types use for
// field access. Outgoing messages are built with nlohmann directly.
//
//   auto doc = hubpp::read_json(R"({"type":6})");
//   if (doc) { int type = (*doc)["type"]; }

#include "hubpp/error.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace hubpp {

using Json = nlohmann::json;

struct JsonReaderConfig {
    // Deepest nesting accepted; hub arguments are user payloads.
    std::size_t max_depth{64};
};

class JsonReader {
public:
    JsonReader() = default;
    explicit JsonReader(JsonReaderConfig config) : config_(config) {}

    /// Parse one complete JSON document. Errors are ParseError.
    [[nodiscard]] HubResult<Json> read(std::string_view text);

    [[nodiscard]] const JsonReaderConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] HubResult<Json> convert(simdjson::dom::element element, std::size_t depth) const;

    simdjson::dom::parser parser_;
    JsonReaderConfig config_;
};

/// Parse with a thread-local JsonReader using the default configuration.
[[nodiscard]] HubResult<Json> read_json(std::string_view text);

}  // namespace hubpp
