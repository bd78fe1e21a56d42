#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Connection Establishment
// ═══════════════════════════════════════════════════════════════════════════
// Turns a negotiate result into a live IConnection:
//
//   negotiate()            POST {address}/negotiate
//        │
//        ▼
//   select_transport()     WebSockets > ServerSentEvents > none
//        │
//        ├── WebSockets ──────▶ dial ws(s)://...?id=..[&access_token=..]
//        ├── ServerSentEvents ▶ GET {address}?id=..  Accept: text/event-stream
//        └── none ────────────▶ nullptr, no error
//
// Exactly one transport is attempted; a failed dial is not retried on SSE.

#include "hubpp/async/cancellation.hpp"
#include "hubpp/connection.hpp"
#include "hubpp/error.hpp"
#include "hubpp/transport/http_connection_options.hpp"
#include "hubpp/transport/negotiate.hpp"
#include "hubpp/transport/websocket_connection.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace hubpp {

enum class TransportType {
    None,
    WebSockets,
    ServerSentEvents
};

[[nodiscard]] constexpr std::string_view to_string(TransportType type) noexcept {
    switch (type) {
        case TransportType::None:             return "None";
        case TransportType::WebSockets:       return "WebSockets";
        case TransportType::ServerSentEvents: return "ServerSentEvents";
    }
    return "Unknown";
}

[[nodiscard]] TransportType select_transport(const NegotiateResponse& negotiated) noexcept;

/// address with "id" set to the routing id. nullopt if address is invalid.
[[nodiscard]] std::optional<std::string> connect_url(
    const std::string& address,
    const NegotiateResponse& negotiated
);

struct WebSocketRequest {
    std::string url;       // ws:// or wss://
    HeaderMap headers;     // never contains a bearer Authorization
};

/// Build the upgrade request: connect_url() with the scheme switched and a
/// bearer Authorization header moved into the access_token parameter.
/// Other Authorization schemes are left in the headers.
[[nodiscard]] HubResult<WebSocketRequest> build_websocket_request(
    const std::string& address,
    const NegotiateResponse& negotiated,
    const HeaderProvider& headers
);

/// Open the preferred transport. Returns nullptr (not an error) when the
/// server offers none this client speaks.
[[nodiscard]] HubResult<std::unique_ptr<IConnection>> establish_transport(
    const CancellationToken& token,
    const std::string& address,
    const NegotiateResponse& negotiated,
    std::shared_ptr<IHttpClient> http_client,
    const HeaderProvider& headers,
    IWebSocketDialer& dialer
);

/// negotiate() followed by establish_transport(). The token covers both
/// steps but not the lifetime of the returned connection.
[[nodiscard]] HubResult<std::unique_ptr<IConnection>> make_http_connection(
    const CancellationToken& token,
    const std::string& address,
    HttpConnectionOptions options = {}
);

}  // namespace hubpp
