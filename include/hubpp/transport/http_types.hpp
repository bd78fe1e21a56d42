#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230. Header providers are
// user code, so "authorization" and "Authorization" must be treated alike.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool header_name_equals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::ranges::equal(lhs, rhs, [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

/// Get header value by name (case-insensitive).
inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

/// Remove every header matching name (case-insensitive).
/// Returns the number of entries erased.
inline std::size_t remove_header(HeaderMap& headers, std::string_view name) {
    return std::erase_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// Negotiate is a POST, the SSE stream is a GET, SSE sends are POSTs.

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed endpoint used by the WebSocket dialer. Accepts http(s) and ws(s).

struct UrlComponents {
    std::string scheme;   // "ws", "wss", "http" or "https"
    std::string host;     // "hub.example.com"
    std::uint16_t port;   // explicit, or the scheme default
    std::string path;     // "/chat" (includes leading slash)
    std::string query;    // "?id=abc" (optional, includes ?)

    [[nodiscard]] bool is_secure() const {
        return scheme == "https" || scheme == "wss";
    }

    [[nodiscard]] std::string host_with_port() const {
        return host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        const bool has_query = (query.empty() == false);
        if (has_query) {
            return path + query;
        }
        return path;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Helpers (using ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// All return nullopt when the input is not a valid absolute URL.

/// Split a URL into components. Only http, https, ws and wss are accepted.
std::optional<UrlComponents> parse_url(const std::string& url);

/// Append "/negotiate" to the path of address. When query is given it
/// replaces the query string of the result.
std::optional<std::string> negotiate_url(
    const std::string& address,
    const std::optional<std::string>& query
);

/// Set (or replace) one query parameter, keeping the others.
std::optional<std::string> with_query_param(
    const std::string& url,
    std::string_view name,
    std::string_view value
);

/// https -> wss, anything else -> ws.
std::optional<std::string> to_websocket_url(const std::string& url);

/// Value of a query parameter, if present.
std::optional<std::string> query_param(const std::string& url, std::string_view name);

}  // namespace hubpp
