#include "hubpp/transport/http_connection_options.hpp"

namespace hubpp {

HttpConnectionOptions& HttpConnectionOptions::with_bearer_token(const std::string& token) {
    // Moved into access_token when the WebSocket transport is chosen.
    remove_header(default_headers, "Authorization");
    default_headers["Authorization"] = "Bearer " + token;
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_header(
    const std::string& name,
    const std::string& value
) {
    remove_header(default_headers, name);
    default_headers[name] = value;
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_headers(HeaderProvider provider) {
    headers = std::move(provider);
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_query_string(QueryStringProvider provider) {
    query_string = std::move(provider);
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_http_client(std::shared_ptr<IHttpClient> client) {
    http_client = std::move(client);
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_websocket_dialer(std::shared_ptr<IWebSocketDialer> dialer) {
    websocket_dialer = std::move(dialer);
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

HttpConnectionOptions& HttpConnectionOptions::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

HeaderProvider HttpConnectionOptions::effective_headers() const {
    const bool has_defaults = (default_headers.empty() == false);
    if (has_defaults == false) {
        return headers;
    }
    return [defaults = default_headers, provider = headers]() {
        HeaderMap merged = defaults;
        if (provider) {
            for (auto& [name, value] : provider()) {
                remove_header(merged, name);
                merged[name] = std::move(value);
            }
        }
        return merged;
    };
}

}  // namespace hubpp
