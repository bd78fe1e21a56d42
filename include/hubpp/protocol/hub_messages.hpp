#ifndef HUBPP_PROTOCOL_HUB_MESSAGES_HPP
#define HUBPP_PROTOCOL_HUB_MESSAGES_HPP

#include "hubpp/error.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hubpp {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Message Types
// ═══════════════════════════════════════════════════════════════════════════
// The numeric "type" field of every hub frame.

enum class MessageType : int {
    Invocation       = 1,
    StreamItem       = 2,
    Completion       = 3,
    StreamInvocation = 4,
    CancelInvocation = 5,
    Ping             = 6,
    Close            = 7
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Invocation:       return "Invocation";
        case MessageType::StreamItem:       return "StreamItem";
        case MessageType::Completion:       return "Completion";
        case MessageType::StreamInvocation: return "StreamInvocation";
        case MessageType::CancelInvocation: return "CancelInvocation";
        case MessageType::Ping:             return "Ping";
        case MessageType::Close:            return "Close";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Messages
// ═══════════════════════════════════════════════════════════════════════════
// Each struct carries its type as a constant; the JSON "type" field is
// written from it and checked against it on decode.

// Call a hub method. Without an invocation id it is fire-and-forget.
struct InvocationMessage {
    static constexpr MessageType type = MessageType::Invocation;

    std::optional<std::string> invocation_id;
    std::string target;
    Json arguments = Json::array();
    std::vector<std::string> stream_ids;

    [[nodiscard]] Json to_json() const;
    static HubResult<InvocationMessage> from_json(const Json& j);
};

// One item of a server-to-client or client-to-server stream.
struct StreamItemMessage {
    static constexpr MessageType type = MessageType::StreamItem;

    std::string invocation_id;
    Json item;

    [[nodiscard]] Json to_json() const;
    static HubResult<StreamItemMessage> from_json(const Json& j);
};

// Ends an invocation or a stream. Carries a result or an error, or neither
// for a void method.
struct CompletionMessage {
    static constexpr MessageType type = MessageType::Completion;

    std::string invocation_id;
    std::optional<Json> result;
    std::optional<std::string> error;

    [[nodiscard]] Json to_json() const;
    static HubResult<CompletionMessage> from_json(const Json& j);
};

struct StreamInvocationMessage {
    static constexpr MessageType type = MessageType::StreamInvocation;

    std::string invocation_id;
    std::string target;
    Json arguments = Json::array();
    std::vector<std::string> stream_ids;

    [[nodiscard]] Json to_json() const;
    static HubResult<StreamInvocationMessage> from_json(const Json& j);
};

struct CancelInvocationMessage {
    static constexpr MessageType type = MessageType::CancelInvocation;

    std::string invocation_id;

    [[nodiscard]] Json to_json() const;
    static HubResult<CancelInvocationMessage> from_json(const Json& j);
};

struct PingMessage {
    static constexpr MessageType type = MessageType::Ping;

    [[nodiscard]] Json to_json() const;
    static HubResult<PingMessage> from_json(const Json& j);
};

struct CloseMessage {
    static constexpr MessageType type = MessageType::Close;

    std::optional<std::string> error;
    bool allow_reconnect{false};

    [[nodiscard]] Json to_json() const;
    static HubResult<CloseMessage> from_json(const Json& j);
};

using HubMessage = std::variant<
    InvocationMessage,
    StreamItemMessage,
    CompletionMessage,
    StreamInvocationMessage,
    CancelInvocationMessage,
    PingMessage,
    CloseMessage
>;

[[nodiscard]] MessageType message_type(const HubMessage& message) noexcept;

[[nodiscard]] Json to_json(const HubMessage& message);

/// Decode any hub message object. The "type" field selects the struct.
/// Unknown types and missing required fields are ProtocolError.
[[nodiscard]] HubResult<HubMessage> hub_message_from_json(const Json& j);

}  // namespace hubpp

#endif  // HUBPP_PROTOCOL_HUB_MESSAGES_HPP
