#pragma once

#include "hubpp/async/cancellation.hpp"
#include "hubpp/error.hpp"
#include "hubpp/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hubpp {

using Json = nlohmann::json;

/// Called once per request; the result is used as-is.
using HeaderProvider = std::function<HeaderMap()>;

/// Called once per negotiate; replaces the query string of the request.
using QueryStringProvider = std::function<std::string()>;

inline constexpr std::string_view kWebSocketsTransport = "WebSockets";
inline constexpr std::string_view kServerSentEventsTransport = "ServerSentEvents";

// ─────────────────────────────────────────────────────────────────────────────
// NegotiateResponse
// ─────────────────────────────────────────────────────────────────────────────
//   {
//     "connectionId": "abc",
//     "connectionToken": "xyz",          (optional)
//     "negotiateVersion": 1,             (optional)
//     "availableTransports": [
//       {"transport": "WebSockets", "transferFormats": ["Text", "Binary"]}
//     ]
//   }

struct AvailableTransport {
    std::string transport;
    std::vector<std::string> transfer_formats;
};

struct NegotiateResponse {
    std::string connection_id;
    std::optional<std::string> connection_token;   // never empty when set
    std::optional<int> negotiate_version;
    std::vector<AvailableTransport> available_transports;

    /// Transfer formats of the named transport, or nullopt when the server
    /// does not offer it at all.
    [[nodiscard]] std::optional<std::vector<std::string>> transfer_formats(std::string_view transport) const;

    [[nodiscard]] bool offers(std::string_view transport) const noexcept;

    /// The value for the "id" query parameter: the token when the server
    /// issued one, otherwise the connection id.
    [[nodiscard]] const std::string& routing_id() const noexcept {
        return connection_token.has_value() ? *connection_token : connection_id;
    }

    [[nodiscard]] Json to_json() const;

    /// ParseError on wrong field types; NegotiationFailed when the server
    /// put an "error" in the body.
    static HubResult<NegotiateResponse> from_json(const Json& j);
};

// ─────────────────────────────────────────────────────────────────────────────
// negotiate
// ─────────────────────────────────────────────────────────────────────────────

/// POST {address}/negotiate and decode the answer. Anything but 200 is an
/// HttpError whose message reads "POST <url> -> <status> <reason>".
[[nodiscard]] HubResult<NegotiateResponse> negotiate(
    const CancellationToken& token,
    const std::string& address,
    IHttpClient& http_client,
    const HeaderProvider& headers = {},
    const QueryStringProvider& query_string = {}
);

}  // namespace hubpp
