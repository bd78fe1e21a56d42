#include "hubpp/json/json_reader.hpp"

namespace hubpp {

namespace {

HubError simdjson_failure(simdjson::error_code code) {
    return HubError::parse_error(std::string("Invalid JSON: ") + simdjson::error_message(code));
}

}  // namespace

HubResult<Json> JsonReader::read(std::string_view text) {
    simdjson::dom::element root;
    const auto code = parser_.parse(text.data(), text.size()).get(root);
    if (code != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(code));
    }
    return convert(root, 0);
}

HubResult<Json> JsonReader::convert(simdjson::dom::element element, std::size_t depth) const {
    if (depth > config_.max_depth) {
        return tl::unexpected(HubError::parse_error(
            "JSON nesting deeper than " + std::to_string(config_.max_depth)
        ));
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            Json object = Json::object();
            for (auto field : simdjson::dom::object(element)) {
                auto value = convert(field.value, depth + 1);
                if (!value) {
                    return value;
                }
                object[std::string(field.key)] = std::move(*value);
            }
            return object;
        }

        case simdjson::dom::element_type::ARRAY: {
            Json array = Json::array();
            for (simdjson::dom::element child : simdjson::dom::array(element)) {
                auto value = convert(child, depth + 1);
                if (!value) {
                    return value;
                }
                array.push_back(std::move(*value));
            }
            return array;
        }

        case simdjson::dom::element_type::STRING:
            return Json(std::string(std::string_view(element)));

        case simdjson::dom::element_type::INT64:
            return Json(std::int64_t(element));

        case simdjson::dom::element_type::UINT64:
            return Json(std::uint64_t(element));

        case simdjson::dom::element_type::DOUBLE:
            return Json(double(element));

        case simdjson::dom::element_type::BOOL:
            return Json(bool(element));

        case simdjson::dom::element_type::NULL_VALUE:
            return Json(nullptr);
    }
    return tl::unexpected(HubError::parse_error("Unknown JSON element type"));
}

HubResult<Json> read_json(std::string_view text) {
    thread_local JsonReader reader;
    return reader.read(text);
}

}  // namespace hubpp
