#include "hubpp/protocol/hub_messages.hpp"

#include <cstdint>
#include <limits>

namespace hubpp {

namespace {

constexpr const char* kType = "type";
constexpr const char* kInvocationId = "invocationId";
constexpr const char* kTarget = "target";
constexpr const char* kArguments = "arguments";
constexpr const char* kStreamIds = "streamIds";
constexpr const char* kItem = "item";
constexpr const char* kResult = "result";
constexpr const char* kError = "error";
constexpr const char* kAllowReconnect = "allowReconnect";

HubError missing(std::string_view field, MessageType type) {
    return HubError::protocol_error(
        std::string(to_string(type)) + " message is missing '" + std::string(field) + "'"
    );
}

HubResult<std::string> required_string(const Json& j, const char* field, MessageType type) {
    const auto it = j.find(field);
    const bool present = (it != j.end()) && it->is_string();
    if (present == false) {
        return tl::unexpected(missing(field, type));
    }
    return it->get<std::string>();
}

HubResult<std::optional<std::string>> optional_string(const Json& j, const char* field, MessageType type) {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>();
    }
    if (it->is_string() == false) {
        return tl::unexpected(HubError::protocol_error(
            std::string(to_string(type)) + " field '" + field + "' must be a string"
        ));
    }
    return std::optional<std::string>(it->get<std::string>());
}

HubResult<Json> required_array(const Json& j, const char* field, MessageType type) {
    const auto it = j.find(field);
    const bool present = (it != j.end()) && it->is_array();
    if (present == false) {
        return tl::unexpected(missing(field, type));
    }
    return *it;
}

HubResult<std::vector<std::string>> stream_ids_of(const Json& j, MessageType type) {
    std::vector<std::string> ids;
    const auto it = j.find(kStreamIds);
    if (it == j.end() || it->is_null()) {
        return ids;
    }
    if (it->is_array() == false) {
        return tl::unexpected(HubError::protocol_error(
            std::string(to_string(type)) + " field 'streamIds' must be an array"
        ));
    }
    for (const auto& id : *it) {
        if (id.is_string() == false) {
            return tl::unexpected(HubError::protocol_error("streamIds entries must be strings"));
        }
        ids.push_back(id.get<std::string>());
    }
    return ids;
}

Json header(MessageType type) {
    return Json{{kType, static_cast<int>(type)}};
}

template <typename Message>
HubResult<HubMessage> decode_as(const Json& j) {
    auto message = Message::from_json(j);
    if (!message) {
        return tl::unexpected(message.error());
    }
    return HubMessage(std::move(*message));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// InvocationMessage
// ─────────────────────────────────────────────────────────────────────────────

Json InvocationMessage::to_json() const {
    Json j = header(type);
    if (invocation_id.has_value()) {
        j[kInvocationId] = *invocation_id;
    }
    j[kTarget] = target;
    j[kArguments] = arguments.is_null() ? Json::array() : arguments;
    if (stream_ids.empty() == false) {
        j[kStreamIds] = stream_ids;
    }
    return j;
}

HubResult<InvocationMessage> InvocationMessage::from_json(const Json& j) {
    auto id = optional_string(j, kInvocationId, type);
    if (!id) {
        return tl::unexpected(id.error());
    }
    auto target = required_string(j, kTarget, type);
    if (!target) {
        return tl::unexpected(target.error());
    }
    auto arguments = required_array(j, kArguments, type);
    if (!arguments) {
        return tl::unexpected(arguments.error());
    }
    auto stream_ids = stream_ids_of(j, type);
    if (!stream_ids) {
        return tl::unexpected(stream_ids.error());
    }

    InvocationMessage message;
    message.invocation_id = std::move(*id);
    message.target = std::move(*target);
    message.arguments = std::move(*arguments);
    message.stream_ids = std::move(*stream_ids);
    return message;
}

// ─────────────────────────────────────────────────────────────────────────────
// StreamItemMessage
// ─────────────────────────────────────────────────────────────────────────────

Json StreamItemMessage::to_json() const {
    Json j = header(type);
    j[kInvocationId] = invocation_id;
    j[kItem] = item;
    return j;
}

HubResult<StreamItemMessage> StreamItemMessage::from_json(const Json& j) {
    auto id = required_string(j, kInvocationId, type);
    if (!id) {
        return tl::unexpected(id.error());
    }
    if (j.contains(kItem) == false) {
        return tl::unexpected(missing(kItem, type));
    }
    return StreamItemMessage{std::move(*id), j.at(kItem)};
}

// ─────────────────────────────────────────────────────────────────────────────
// CompletionMessage
// ─────────────────────────────────────────────────────────────────────────────

Json CompletionMessage::to_json() const {
    Json j = header(type);
    j[kInvocationId] = invocation_id;
    if (result.has_value()) {
        j[kResult] = *result;
    }
    if (error.has_value()) {
        j[kError] = *error;
    }
    return j;
}

HubResult<CompletionMessage> CompletionMessage::from_json(const Json& j) {
    auto id = required_string(j, kInvocationId, type);
    if (!id) {
        return tl::unexpected(id.error());
    }
    auto error = optional_string(j, kError, type);
    if (!error) {
        return tl::unexpected(error.error());
    }

    CompletionMessage message;
    message.invocation_id = std::move(*id);
    message.error = std::move(*error);
    const auto result = j.find(kResult);
    if (result != j.end()) {
        message.result = *result;
    }
    return message;
}

// ─────────────────────────────────────────────────────────────────────────────
// StreamInvocationMessage
// ─────────────────────────────────────────────────────────────────────────────

Json StreamInvocationMessage::to_json() const {
    Json j = header(type);
    j[kInvocationId] = invocation_id;
    j[kTarget] = target;
    j[kArguments] = arguments.is_null() ? Json::array() : arguments;
    if (stream_ids.empty() == false) {
        j[kStreamIds] = stream_ids;
    }
    return j;
}

HubResult<StreamInvocationMessage> StreamInvocationMessage::from_json(const Json& j) {
    auto id = required_string(j, kInvocationId, type);
    if (!id) {
        return tl::unexpected(id.error());
    }
    auto target = required_string(j, kTarget, type);
    if (!target) {
        return tl::unexpected(target.error());
    }
    auto arguments = required_array(j, kArguments, type);
    if (!arguments) {
        return tl::unexpected(arguments.error());
    }
    auto stream_ids = stream_ids_of(j, type);
    if (!stream_ids) {
        return tl::unexpected(stream_ids.error());
    }

    StreamInvocationMessage message;
    message.invocation_id = std::move(*id);
    message.target = std::move(*target);
    message.arguments = std::move(*arguments);
    message.stream_ids = std::move(*stream_ids);
    return message;
}

// ─────────────────────────────────────────────────────────────────────────────
// CancelInvocationMessage / PingMessage / CloseMessage
// ─────────────────────────────────────────────────────────────────────────────

Json CancelInvocationMessage::to_json() const {
    Json j = header(type);
    j[kInvocationId] = invocation_id;
    return j;
}

HubResult<CancelInvocationMessage> CancelInvocationMessage::from_json(const Json& j) {
    auto id = required_string(j, kInvocationId, type);
    if (!id) {
        return tl::unexpected(id.error());
    }
    return CancelInvocationMessage{std::move(*id)};
}

Json PingMessage::to_json() const {
    return header(type);
}

HubResult<PingMessage> PingMessage::from_json(const Json& /*j*/) {
    return PingMessage{};
}

Json CloseMessage::to_json() const {
    Json j = header(type);
    if (error.has_value()) {
        j[kError] = *error;
    }
    j[kAllowReconnect] = allow_reconnect;
    return j;
}

HubResult<CloseMessage> CloseMessage::from_json(const Json& j) {
    auto error = optional_string(j, kError, type);
    if (!error) {
        return tl::unexpected(error.error());
    }

    CloseMessage message;
    message.error = std::move(*error);
    const auto allow = j.find(kAllowReconnect);
    if (allow != j.end() && allow->is_boolean()) {
        message.allow_reconnect = allow->get<bool>();
    }
    return message;
}

// ─────────────────────────────────────────────────────────────────────────────
// HubMessage
// ─────────────────────────────────────────────────────────────────────────────

MessageType message_type(const HubMessage& message) noexcept {
    return std::visit([](const auto& m) { return m.type; }, message);
}

Json to_json(const HubMessage& message) {
    return std::visit([](const auto& m) { return m.to_json(); }, message);
}

HubResult<HubMessage> hub_message_from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(HubError::protocol_error("Hub message must be a JSON object"));
    }
    const auto type_field = j.find(kType);
    const bool has_type = (type_field != j.end()) && type_field->is_number_integer();
    if (has_type == false) {
        return tl::unexpected(HubError::protocol_error("Hub message is missing an integer 'type'"));
    }

    // Wider values must not wrap onto a known type.
    const bool in_range = type_field->is_number_unsigned()
        ? type_field->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : (type_field->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
           type_field->get<std::int64_t>() <= std::numeric_limits<int>::max());
    if (in_range == false) {
        return tl::unexpected(HubError::protocol_error(
            "Unknown hub message type " + type_field->dump()
        ));
    }

    const auto raw_type = type_field->get<int>();
    switch (static_cast<MessageType>(raw_type)) {
        case MessageType::Invocation:       return decode_as<InvocationMessage>(j);
        case MessageType::StreamItem:       return decode_as<StreamItemMessage>(j);
        case MessageType::Completion:       return decode_as<CompletionMessage>(j);
        case MessageType::StreamInvocation: return decode_as<StreamInvocationMessage>(j);
        case MessageType::CancelInvocation: return decode_as<CancelInvocationMessage>(j);
        case MessageType::Ping:             return decode_as<PingMessage>(j);
        case MessageType::Close:            return decode_as<CloseMessage>(j);
    }
    return tl::unexpected(HubError::protocol_error(
        "Unknown hub message type " + std::to_string(raw_type)
    ));
}

}  // namespace hubpp
