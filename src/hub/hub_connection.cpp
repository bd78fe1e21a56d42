#include "hubpp/hub/hub_connection.hpp"
#include "hubpp/log/logger.hpp"

#include <stdexcept>

namespace hubpp {

HubConnection::HubConnection(
    std::unique_ptr<IConnection> connection,
    std::shared_ptr<IHubProtocol> protocol,
    HubConnectionConfig config
)
    : connection_(std::move(connection))
    , protocol_(std::move(protocol))
    , config_(config)
{
    if (!connection_) {
        throw std::invalid_argument("HubConnection requires a connection");
    }
    if (!protocol_) {
        throw std::invalid_argument("HubConnection requires a protocol");
    }
    if (config_.maximum_receive_message_size == 0) {
        config_.maximum_receive_message_size = HubConnectionConfig{}.maximum_receive_message_size;
    }
    read_buffer_.resize(config_.maximum_receive_message_size);
}

HubConnection::~HubConnection() {
    connection_->close();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

bool HubConnection::start() {
    HubState expected = HubState::Idle;
    const bool started = state_.compare_exchange_strong(expected, HubState::Connected);
    if (started) {
        get_logger().logf(LogLevel::Debug, "Hub connection {}: Idle -> Connected", connection_id());
    }
    return started;
}

bool HubConnection::is_connected() const noexcept {
    return state_.load() == HubState::Connected;
}

HubState HubConnection::state() const noexcept {
    return state_.load();
}

SendResult<CloseMessage> HubConnection::close(const std::string& error) {
    HubState current = state_.load();
    while (current == HubState::Idle || current == HubState::Connected) {
        if (state_.compare_exchange_weak(current, HubState::Closed)) {
            get_logger().logf(LogLevel::Debug, "Hub connection {}: {} -> Closed", connection_id(), to_string(current));
            break;
        }
    }

    CloseMessage message;
    if (error.empty() == false) {
        message.error = error;
    }
    message.allow_reconnect = true;
    return send(std::move(message));
}

void HubConnection::abort() {
    cancellation_.cancel();
    const HubState previous = state_.exchange(HubState::Aborted);
    if (previous != HubState::Aborted) {
        get_logger().logf(LogLevel::Debug, "Hub connection {}: {} -> Aborted", connection_id(), to_string(previous));
    }
    connection_->close();
}

CancellationToken HubConnection::token() const noexcept {
    return cancellation_.token();
}

std::string HubConnection::connection_id() const {
    return connection_->connection_id();
}

// ─────────────────────────────────────────────────────────────────────────────
// Receive
// ─────────────────────────────────────────────────────────────────────────────

HubResult<HubMessage> HubConnection::receive() {
    auto outcome = run_cancellable(cancellation_.token(), [this]() { return read_one(); });
    if (!outcome.has_value()) {
        return tl::unexpected(HubError::cancelled());
    }
    return std::move(*outcome);
}

HubResult<HubMessage> HubConnection::read_one() {
    while (true) {
        auto parsed = protocol_->read_message(pending_);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        if (parsed->has_value()) {
            return std::move(**parsed);
        }

        auto count = connection_->read(read_buffer_);
        if (!count) {
            return tl::unexpected(count.error());
        }
        pending_.append(read_buffer_.data(), *count);
        HUBPP_LOG(Trace, "Hub connection buffered incoming bytes");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Send
// ─────────────────────────────────────────────────────────────────────────────

HubResult<void> HubConnection::write_message(const HubMessage& message) {
    auto outcome = run_cancellable(cancellation_.token(), [this, &message]() {
        return protocol_->write_message(message, *connection_);
    });
    if (!outcome.has_value()) {
        return tl::unexpected(HubError::cancelled());
    }
    if (!*outcome) {
        get_logger().logf(LogLevel::Debug, "Hub connection {}: {} write failed: {}",
            connection_id(),
            to_string(message_type(message)),
            outcome->error().message
        );
    }
    return std::move(*outcome);
}

SendResult<InvocationMessage> HubConnection::send_invocation_with(std::string target, Json arguments) {
    InvocationMessage message;
    message.target = std::move(target);
    if (arguments.is_array()) {
        message.arguments = std::move(arguments);
    } else if (arguments.is_null() == false) {
        message.arguments.push_back(std::move(arguments));
    }
    return send(std::move(message));
}

SendResult<StreamItemMessage> HubConnection::stream_item(std::string invocation_id, Json item) {
    return send(StreamItemMessage{std::move(invocation_id), std::move(item)});
}

SendResult<CompletionMessage> HubConnection::completion(
    std::string invocation_id,
    std::optional<Json> result,
    std::optional<std::string> error
) {
    CompletionMessage message;
    message.invocation_id = std::move(invocation_id);
    message.result = std::move(result);
    message.error = std::move(error);
    return send(std::move(message));
}

SendResult<PingMessage> HubConnection::ping() {
    return send(PingMessage{});
}

}  // namespace hubpp
