#include "hubpp/transport/http_connection.hpp"
#include "hubpp/log/logger.hpp"
#include "hubpp/transport/sse_connection.hpp"

namespace hubpp {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

// "Bearer abc" -> "abc". nullopt for other schemes.
std::optional<std::string> bearer_token(const std::string& authorization) {
    const bool is_bearer = (authorization.size() >= kBearerPrefix.size()) &&
                           header_name_equals(authorization.substr(0, kBearerPrefix.size()), kBearerPrefix);
    if (is_bearer == false) {
        return std::nullopt;
    }
    return authorization.substr(kBearerPrefix.size());
}

HubResult<std::unique_ptr<IConnection>> open_websocket(
    const CancellationToken& token,
    const std::string& address,
    const NegotiateResponse& negotiated,
    const HeaderProvider& headers,
    IWebSocketDialer& dialer
) {
    auto request = build_websocket_request(address, negotiated, headers);
    if (!request) {
        return tl::unexpected(request.error());
    }
    return dialer.dial(request->url, request->headers, negotiated.connection_id, token);
}

HubResult<std::unique_ptr<IConnection>> open_event_stream(
    const CancellationToken& token,
    const std::string& address,
    const NegotiateResponse& negotiated,
    std::shared_ptr<IHttpClient> http_client,
    const HeaderProvider& headers
) {
    const auto url = connect_url(address, negotiated);
    if (!url.has_value()) {
        return tl::unexpected(HubError::invalid_url(address));
    }

    HeaderMap request_headers;
    if (headers) {
        request_headers = headers();
    }
    HeaderMap send_headers = request_headers;
    remove_header(request_headers, "Accept");
    request_headers["Accept"] = "text/event-stream";

    auto stream = http_client->open_stream(*url, request_headers, token);
    if (!stream) {
        return tl::unexpected(HubError::from_client_error(stream.error()));
    }

    const int status = (*stream)->status_code();
    const bool ok = (status >= 200) && (status < 300);
    if (ok == false) {
        (*stream)->close();
        return tl::unexpected(HubError::http_error(
            status,
            to_string(HttpMethod::Get) + " " + *url + " -> " + std::to_string(status)
        ));
    }

    return std::unique_ptr<IConnection>(std::make_unique<ServerSentEventsConnection>(
        std::move(*stream),
        std::move(http_client),
        *url,
        std::move(send_headers),
        negotiated.connection_id
    ));
}

}  // namespace

TransportType select_transport(const NegotiateResponse& negotiated) noexcept {
    if (negotiated.offers(kWebSocketsTransport)) {
        return TransportType::WebSockets;
    }
    if (negotiated.offers(kServerSentEventsTransport)) {
        return TransportType::ServerSentEvents;
    }
    return TransportType::None;
}

std::optional<std::string> connect_url(const std::string& address, const NegotiateResponse& negotiated) {
    return with_query_param(address, "id", negotiated.routing_id());
}

HubResult<WebSocketRequest> build_websocket_request(
    const std::string& address,
    const NegotiateResponse& negotiated,
    const HeaderProvider& headers
) {
    auto url = connect_url(address, negotiated);
    if (url.has_value()) {
        url = to_websocket_url(*url);
    }
    if (!url.has_value()) {
        return tl::unexpected(HubError::invalid_url(address));
    }

    WebSocketRequest request;
    if (headers) {
        request.headers = headers();
    }

    const auto authorization = get_header(request.headers, "Authorization");
    if (authorization.has_value()) {
        const auto access_token = bearer_token(*authorization);
        if (access_token.has_value()) {
            remove_header(request.headers, "Authorization");
            if (access_token->empty() == false) {
                url = with_query_param(*url, "access_token", *access_token);
                if (!url.has_value()) {
                    return tl::unexpected(HubError::invalid_url(address));
                }
            }
        }
    }

    request.url = std::move(*url);
    return request;
}

HubResult<std::unique_ptr<IConnection>> establish_transport(
    const CancellationToken& token,
    const std::string& address,
    const NegotiateResponse& negotiated,
    std::shared_ptr<IHttpClient> http_client,
    const HeaderProvider& headers,
    IWebSocketDialer& dialer
) {
    const TransportType transport = select_transport(negotiated);
    get_logger().logf(LogLevel::Info, "Selected transport {} for connection {}", to_string(transport), negotiated.connection_id);

    switch (transport) {
        case TransportType::WebSockets:
            return open_websocket(token, address, negotiated, headers, dialer);
        case TransportType::ServerSentEvents:
            return open_event_stream(token, address, negotiated, std::move(http_client), headers);
        case TransportType::None:
            break;
    }
    return std::unique_ptr<IConnection>();
}

HubResult<std::unique_ptr<IConnection>> make_http_connection(
    const CancellationToken& token,
    const std::string& address,
    HttpConnectionOptions options
) {
    if (!options.http_client) {
        options.http_client = make_http_client();
        options.http_client->set_connect_timeout(options.connect_timeout);
        options.http_client->set_read_timeout(options.read_timeout);
        options.http_client->set_verify_ssl(options.verify_ssl);
    }
    if (!options.websocket_dialer) {
        options.websocket_dialer = make_websocket_dialer(options.connect_timeout, options.verify_ssl);
    }

    const HeaderProvider headers = options.effective_headers();

    auto negotiated = negotiate(token, address, *options.http_client, headers, options.query_string);
    if (!negotiated) {
        return tl::unexpected(negotiated.error());
    }

    return establish_transport(
        token,
        address,
        *negotiated,
        options.http_client,
        headers,
        *options.websocket_dialer
    );
}

}  // namespace hubpp
