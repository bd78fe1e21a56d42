#pragma once

#include "hubpp/async/cancellation.hpp"
#include "hubpp/connection.hpp"
#include "hubpp/error.hpp"
#include "hubpp/protocol/hub_messages.hpp"
#include "hubpp/protocol/hub_protocol.hpp"

#include <any>
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// Hub State
// ─────────────────────────────────────────────────────────────────────────────
///
///        ┌──────┐  start()   ┌───────────┐
///        │ Idle │───────────▶│ Connected │
///        └──┬───┘            └─────┬─────┘
///           │                      │
///           │ close()   ┌──────────┼──────────┐ abort()
///           │           ▼ close()  │          ▼
///           │      ┌────────┐      │     ┌─────────┐
///           └─────▶│ Closed │      └────▶│ Aborted │
///                  └────────┘            └─────────┘
///
/// Closed and Aborted are final; start() never leaves them. abort() also
/// moves Idle and Closed to Aborted.
enum class HubState : std::uint8_t {
    Idle,
    Connected,
    Closed,
    Aborted
};

[[nodiscard]] constexpr std::string_view to_string(HubState state) noexcept {
    switch (state) {
        case HubState::Idle:      return "Idle";
        case HubState::Connected: return "Connected";
        case HubState::Closed:    return "Closed";
        case HubState::Aborted:   return "Aborted";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HubConnectionConfig {
    // Largest single read from the connection while a frame is incomplete.
    // Frames themselves may be longer; they are assembled over several reads.
    std::size_t maximum_receive_message_size{32 * 1024};

    HubConnectionConfig& with_maximum_receive_message_size(std::size_t size) {
        maximum_receive_message_size = size;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SendResult
// ─────────────────────────────────────────────────────────────────────────────
// The message is returned even when the write failed, so callers can log or
// retry it.

template <typename Message>
struct SendResult {
    Message message;
    HubResult<void> status;

    [[nodiscard]] bool ok() const noexcept { return status.has_value(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// HubConnection
// ─────────────────────────────────────────────────────────────────────────────
// One hub session over an established connection. Blocking work (a read or
// a write) runs on a worker thread per call and races the session's
// cancellation scope; the worker is always joined before the call returns.
//
//   HubConnection hub(std::move(connection), std::make_shared<JsonHubProtocol>());
//   hub.start();
//   hub.send_invocation("Send", "alice", "hello");
//   auto message = hub.receive();
//
// receive() must not be called concurrently with itself. Senders may be
// called from any thread; frame-level serialization is the connection's job.

class HubConnection {
public:
    using Items = std::unordered_map<std::string, std::any>;

    /// Throws std::invalid_argument when connection or protocol is null,
    /// e.g. the nullptr establish_transport() returns for no usable transport.
    HubConnection(
        std::unique_ptr<IConnection> connection,
        std::shared_ptr<IHubProtocol> protocol,
        HubConnectionConfig config = {}
    );

    /// Closes the underlying connection.
    ~HubConnection();

    HubConnection(const HubConnection&) = delete;
    HubConnection& operator=(const HubConnection&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Idle -> Connected. Returns true only for the call that made the move.
    bool start();

    [[nodiscard]] bool is_connected() const noexcept;

    [[nodiscard]] HubState state() const noexcept;

    /// Leaves Connected, then sends a CloseMessage with allow_reconnect set.
    /// In-flight calls are not cancelled and the connection stays open.
    SendResult<CloseMessage> close(const std::string& error = {});

    /// Cancel every in-flight and future receive/send with Cancelled, leave
    /// Connected and close the connection so a blocked read returns.
    void abort();

    /// Observes abort().
    [[nodiscard]] CancellationToken token() const noexcept;

    [[nodiscard]] std::string connection_id() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Messaging
    // ─────────────────────────────────────────────────────────────────────────

    /// Next complete message. Bytes after it stay buffered for the next call.
    [[nodiscard]] HubResult<HubMessage> receive();

    /// Fire-and-forget invocation; each argument is converted to JSON.
    template <typename... Args>
    SendResult<InvocationMessage> send_invocation(std::string target, Args&&... args) {
        Json arguments = Json::array();
        (arguments.push_back(Json(std::forward<Args>(args))), ...);
        return send_invocation_with(std::move(target), std::move(arguments));
    }

    /// As send_invocation(), with a prebuilt argument array.
    SendResult<InvocationMessage> send_invocation_with(std::string target, Json arguments);

    SendResult<StreamItemMessage> stream_item(std::string invocation_id, Json item);

    SendResult<CompletionMessage> completion(
        std::string invocation_id,
        std::optional<Json> result,
        std::optional<std::string> error = std::nullopt
    );

    SendResult<PingMessage> ping();

    // ─────────────────────────────────────────────────────────────────────────
    // Per-connection state
    // ─────────────────────────────────────────────────────────────────────────

    /// Caller-managed values. Not synchronized.
    [[nodiscard]] Items& items() noexcept { return items_; }

private:
    HubResult<HubMessage> read_one();
    HubResult<void> write_message(const HubMessage& message);

    template <typename Message>
    SendResult<Message> send(Message message) {
        auto status = write_message(HubMessage(message));
        return SendResult<Message>{std::move(message), std::move(status)};
    }

    std::unique_ptr<IConnection> connection_;
    std::shared_ptr<IHubProtocol> protocol_;
    HubConnectionConfig config_;

    std::atomic<HubState> state_{HubState::Idle};
    CancellationSource cancellation_;
    Items items_;

    // Touched only by the single in-flight receive worker.
    std::string pending_;
    std::vector<char> read_buffer_;
};

}  // namespace hubpp
