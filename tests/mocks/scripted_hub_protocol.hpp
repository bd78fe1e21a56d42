#ifndef HUBPP_TESTS_MOCKS_SCRIPTED_HUB_PROTOCOL_HPP
#define HUBPP_TESTS_MOCKS_SCRIPTED_HUB_PROTOCOL_HPP

#include "hubpp/protocol/hub_protocol.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace hubpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedHubProtocol - line-framed stand-in for a real hub protocol
// ─────────────────────────────────────────────────────────────────────────────
// Frames end in '\n'. The frame text decides the message:
//   "ping"   -> PingMessage
//   "bad"    -> ProtocolError (frame consumed)
//   anything -> InvocationMessage with that text as target
//
// write_message() records the message and writes "<type number>\n".

class ScriptedHubProtocol final : public IHubProtocol {
public:
    HubResult<std::optional<HubMessage>> read_message(std::string& buffer) override {
        const auto end = buffer.find('\n');
        if (end == std::string::npos) {
            return std::optional<HubMessage>();
        }
        std::string frame = buffer.substr(0, end);
        buffer.erase(0, end + 1);

        if (frame == "ping") {
            return std::optional<HubMessage>(PingMessage{});
        }
        if (frame == "bad") {
            return tl::unexpected(HubError::protocol_error("Scripted bad frame"));
        }
        InvocationMessage message;
        message.target = std::move(frame);
        return std::optional<HubMessage>(std::move(message));
    }

    HubResult<void> write_message(const HubMessage& message, IConnection& connection) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            written_.push_back(message);
        }
        const std::string frame = std::to_string(static_cast<int>(message_type(message))) + "\n";
        auto count = connection.write(frame);
        if (!count) {
            return tl::unexpected(count.error());
        }
        return {};
    }

    [[nodiscard]] std::string_view name() const noexcept override {
        return "scripted";
    }

    [[nodiscard]] std::vector<HubMessage> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<HubMessage> written_;
};

}  // namespace hubpp::testing

#endif  // HUBPP_TESTS_MOCKS_SCRIPTED_HUB_PROTOCOL_HPP
