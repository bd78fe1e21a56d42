#pragma once

#include "hubpp/async/cancellation.hpp"
#include "hubpp/connection.hpp"
#include "hubpp/error.hpp"
#include "hubpp/transport/http_types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// IWebSocketDialer
// ─────────────────────────────────────────────────────────────────────────────
// Opens a WebSocket and hands it back as an IConnection. The URL already
// carries the routing id (and access_token, if any); headers are sent on the
// upgrade request as-is.

class IWebSocketDialer {
public:
    virtual ~IWebSocketDialer() = default;

    [[nodiscard]] virtual HubResult<std::unique_ptr<IConnection>> dial(
        const std::string& url,
        const HeaderMap& headers,
        const std::string& connection_id,
        const CancellationToken& token
    ) = 0;
};

/// Boost.Beast dialer for ws:// and wss:// (OpenSSL). The returned
/// connection exchanges text frames; read() hands out frame bytes in order
/// and keeps whatever does not fit for the next call. All stream I/O runs on
/// one thread owned by the connection, so a read and a write may be in
/// flight at once; writes are serialized. close() closes the socket on that
/// thread so a blocked read() or write() returns.
[[nodiscard]] std::shared_ptr<IWebSocketDialer> make_websocket_dialer(
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10),
    bool verify_ssl = true
);

}  // namespace hubpp
