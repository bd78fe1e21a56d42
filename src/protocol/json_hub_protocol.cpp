#include "hubpp/protocol/json_hub_protocol.hpp"
#include "hubpp/log/logger.hpp"

#include <algorithm>

namespace hubpp {

HubResult<std::optional<HubMessage>> JsonHubProtocol::read_message(std::string& buffer) {
    const auto end = buffer.find(kRecordSeparator);
    if (end == std::string::npos) {
        return std::optional<HubMessage>();
    }

    const std::string frame = buffer.substr(0, end);
    buffer.erase(0, end + 1);

    auto document = reader_.read(frame);
    if (!document) {
        get_logger().logf(LogLevel::Warn, "Discarding malformed hub frame ({} bytes)", frame.size());
        return tl::unexpected(document.error());
    }

    auto message = hub_message_from_json(*document);
    if (!message) {
        return tl::unexpected(message.error());
    }
    return std::optional<HubMessage>(std::move(*message));
}

HubResult<void> JsonHubProtocol::write_message(const HubMessage& message, IConnection& connection) {
    std::string frame;
    try {
        frame = encode(message);
    } catch (const Json::exception& e) {
        get_logger().logf(LogLevel::Warn, "Cannot encode {} message: {}", to_string(message_type(message)), e.what());
        return tl::unexpected(HubError::protocol_error(std::string("Cannot encode hub message: ") + e.what()));
    }

    std::string_view remaining = frame;
    while (remaining.empty() == false) {
        auto written = connection.write(remaining);
        if (!written) {
            return tl::unexpected(written.error());
        }
        if (*written == 0) {
            return tl::unexpected(HubError::io("Connection accepted no bytes"));
        }
        remaining.remove_prefix(std::min(*written, remaining.size()));
    }
    return {};
}

std::string JsonHubProtocol::encode(const HubMessage& message) {
    std::string frame = to_json(message).dump();
    frame.push_back(kRecordSeparator);
    return frame;
}

std::string JsonHubProtocol::handshake_request() {
    std::string frame = Json{{"protocol", "json"}, {"version", 1}}.dump();
    frame.push_back(kRecordSeparator);
    return frame;
}

}  // namespace hubpp
