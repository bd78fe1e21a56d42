#pragma once

#include "hubpp/async/cancellation.hpp"
#include "hubpp/connection.hpp"
#include "hubpp/transport/http_client.hpp"
#include "hubpp/transport/sse_parser.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace hubpp {

inline constexpr const char* kSseSendContentType = "text/plain;charset=UTF-8";

// ─────────────────────────────────────────────────────────────────────────────
// ServerSentEventsConnection
// ─────────────────────────────────────────────────────────────────────────────
// Server-to-client bytes are the data fields of the event stream, in order.
// Client-to-server bytes go out as one POST per write() to the same URL the
// stream was opened on. close() ends the stream and aborts any POST in flight.

class ServerSentEventsConnection final : public IConnection {
public:
    ServerSentEventsConnection(
        std::unique_ptr<IHttpBodyStream> stream,
        std::shared_ptr<IHttpClient> http_client,
        std::string send_url,
        HeaderMap send_headers,
        std::string connection_id,
        SseParserConfig parser_config = {}
    );

    ~ServerSentEventsConnection() override;

    ServerSentEventsConnection(const ServerSentEventsConnection&) = delete;
    ServerSentEventsConnection& operator=(const ServerSentEventsConnection&) = delete;

    [[nodiscard]] HubResult<std::size_t> read(std::span<char> buffer) override;

    [[nodiscard]] HubResult<std::size_t> write(std::string_view data) override;

    [[nodiscard]] std::string connection_id() const override { return connection_id_; }

    void close() override;

private:
    std::unique_ptr<IHttpBodyStream> stream_;
    std::shared_ptr<IHttpClient> http_client_;
    std::string send_url_;
    HeaderMap send_headers_;
    std::string connection_id_;

    std::mutex read_mutex_;
    SseParser parser_;
    std::string pending_;

    std::atomic<bool> closed_{false};
    CancellationSource sends_;
};

}  // namespace hubpp
