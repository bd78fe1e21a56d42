#include "hubpp/transport/sse_connection.hpp"
#include "hubpp/log/logger.hpp"

#include <algorithm>
#include <cstring>

namespace hubpp {

ServerSentEventsConnection::ServerSentEventsConnection(
    std::unique_ptr<IHttpBodyStream> stream,
    std::shared_ptr<IHttpClient> http_client,
    std::string send_url,
    HeaderMap send_headers,
    std::string connection_id,
    SseParserConfig parser_config
)
    : stream_(std::move(stream))
    , http_client_(std::move(http_client))
    , send_url_(std::move(send_url))
    , send_headers_(std::move(send_headers))
    , connection_id_(std::move(connection_id))
    , parser_(parser_config)
{
    // The stream's Accept header must not leak into the sends.
    remove_header(send_headers_, "Accept");
}

ServerSentEventsConnection::~ServerSentEventsConnection() {
    close();
}

HubResult<std::size_t> ServerSentEventsConnection::read(std::span<char> buffer) {
    std::lock_guard<std::mutex> lock(read_mutex_);

    while (pending_.empty()) {
        if (closed_.load()) {
            return tl::unexpected(HubError::closed());
        }

        auto chunk = stream_->read_chunk();
        if (!chunk) {
            if (closed_.load()) {
                return tl::unexpected(HubError::closed());
            }
            return tl::unexpected(HubError::io("Event stream read failed: " + chunk.error().message));
        }
        if (!chunk->has_value()) {
            return tl::unexpected(HubError::closed("Event stream ended"));
        }

        auto events = parser_.feed(**chunk);
        if (!events) {
            return tl::unexpected(events.error());
        }
        for (const auto& event : *events) {
            pending_ += event.data;
        }
    }

    const std::size_t count = std::min(buffer.size(), pending_.size());
    std::memcpy(buffer.data(), pending_.data(), count);
    pending_.erase(0, count);
    return count;
}

HubResult<std::size_t> ServerSentEventsConnection::write(std::string_view data) {
    if (closed_.load()) {
        return tl::unexpected(HubError::closed());
    }

    auto response = http_client_->post(
        send_url_,
        std::string(data),
        kSseSendContentType,
        send_headers_,
        sends_.token()
    );
    if (!response) {
        if (closed_.load()) {
            return tl::unexpected(HubError::closed());
        }
        return tl::unexpected(HubError::from_client_error(response.error()));
    }
    if (response->is_success() == false) {
        get_logger().logf(LogLevel::Warn, "SSE send rejected with {}", response->status_text());
        return tl::unexpected(HubError::http_error(
            response->status_code,
            "POST " + send_url_ + " -> " + response->status_text()
        ));
    }
    return data.size();
}

void ServerSentEventsConnection::close() {
    const bool was_closed = closed_.exchange(true);
    if (was_closed) {
        return;
    }
    sends_.cancel();
    stream_->close();
    get_logger().logf(LogLevel::Debug, "SSE connection {} closed", connection_id_);
}

}  // namespace hubpp
