#ifndef HUBPP_TRANSPORT_HTTP_CONNECTION_OPTIONS_HPP
#define HUBPP_TRANSPORT_HTTP_CONNECTION_OPTIONS_HPP

#include "hubpp/transport/http_client.hpp"
#include "hubpp/transport/negotiate.hpp"
#include "hubpp/transport/websocket_connection.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Connection Options
// ─────────────────────────────────────────────────────────────────────────────
// Everything make_http_connection() needs besides the address. Collaborators
// left null are created from the timeout and TLS settings below.

struct HttpConnectionOptions {
    // ─────────────────────────────────────────────────────────────────────────
    // Collaborators
    // ─────────────────────────────────────────────────────────────────────────

    // Used for negotiate, the SSE stream and SSE sends. Default: cpr.
    std::shared_ptr<IHttpClient> http_client;

    // Used when the server offers WebSockets. Default: Boost.Beast.
    std::shared_ptr<IWebSocketDialer> websocket_dialer;

    // ─────────────────────────────────────────────────────────────────────────
    // Request Shaping
    // ─────────────────────────────────────────────────────────────────────────

    // Sent on every request. Entries from `headers` win on conflict.
    HeaderMap default_headers;

    // Resolved at request time, so tokens can be refreshed between calls.
    HeaderProvider headers;

    // Replaces the query string of the negotiate request.
    QueryStringProvider query_string;

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts / TLS (only applied to collaborators created here)
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds read_timeout{30'000};
    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   options.with_bearer_token("xxx").with_connect_timeout(5s)

    HttpConnectionOptions& with_bearer_token(const std::string& token);
    HttpConnectionOptions& with_header(const std::string& name, const std::string& value);
    HttpConnectionOptions& with_headers(HeaderProvider provider);
    HttpConnectionOptions& with_query_string(QueryStringProvider provider);
    HttpConnectionOptions& with_http_client(std::shared_ptr<IHttpClient> client);
    HttpConnectionOptions& with_websocket_dialer(std::shared_ptr<IWebSocketDialer> dialer);
    HttpConnectionOptions& with_connect_timeout(std::chrono::milliseconds timeout);
    HttpConnectionOptions& with_read_timeout(std::chrono::milliseconds timeout);
    HttpConnectionOptions& with_verify_ssl(bool verify);

    /// default_headers merged with the headers provider. Empty when neither
    /// is set.
    [[nodiscard]] HeaderProvider effective_headers() const;
};

}  // namespace hubpp

#endif  // HUBPP_TRANSPORT_HTTP_CONNECTION_OPTIONS_HPP
