#include "hubpp/transport/http_types.hpp"

#include <ada.h>

namespace hubpp {

namespace {

// Scheme without the trailing colon ada keeps ("https:" -> "https").
std::string scheme_of(const ada::url_aggregator& url) {
    std::string scheme(url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }
    return scheme;
}

std::uint16_t default_port(std::string_view scheme) {
    const bool secure = (scheme == "https") || (scheme == "wss");
    return secure ? 443 : 80;
}

// ada's search includes the leading '?', url_search_params wants it without.
std::string_view strip_question_mark(std::string_view search) {
    if (search.empty() == false && search.front() == '?') {
        search.remove_prefix(1);
    }
    return search;
}

}  // namespace

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed) {
        return std::nullopt;
    }

    std::string scheme = scheme_of(*parsed);
    const bool supported = (scheme == "http") || (scheme == "https") ||
                           (scheme == "ws") || (scheme == "wss");
    if (supported == false) {
        return std::nullopt;
    }

    std::string host(parsed->get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = default_port(scheme);
    const auto port_str = parsed->get_port();
    const bool has_explicit_port = (port_str.empty() == false);
    if (has_explicit_port) {
        port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    }

    std::string path(parsed->get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(parsed->get_search());
    return result;
}

std::optional<std::string> negotiate_url(
    const std::string& address,
    const std::optional<std::string>& query
) {
    auto parsed = ada::parse<ada::url_aggregator>(address);
    if (!parsed) {
        return std::nullopt;
    }

    std::string path(parsed->get_pathname());
    const bool has_trailing_slash = (path.empty() == false) && (path.back() == '/');
    if (has_trailing_slash) {
        path.pop_back();
    }
    path += "/negotiate";
    if (parsed->set_pathname(path) == false) {
        return std::nullopt;
    }

    if (query.has_value()) {
        parsed->set_search(strip_question_mark(*query));
    }
    return std::string(parsed->get_href());
}

std::optional<std::string> with_query_param(
    const std::string& url,
    std::string_view name,
    std::string_view value
) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed) {
        return std::nullopt;
    }

    ada::url_search_params params(strip_question_mark(parsed->get_search()));
    params.set(name, value);
    parsed->set_search(params.to_string());
    return std::string(parsed->get_href());
}

std::optional<std::string> to_websocket_url(const std::string& url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed) {
        return std::nullopt;
    }

    const bool secure = (scheme_of(*parsed) == "https");
    if (parsed->set_protocol(secure ? "wss" : "ws") == false) {
        return std::nullopt;
    }
    return std::string(parsed->get_href());
}

std::optional<std::string> query_param(const std::string& url, std::string_view name) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed) {
        return std::nullopt;
    }

    ada::url_search_params params(strip_question_mark(parsed->get_search()));
    auto value = params.get(name);
    if (value.has_value() == false) {
        return std::nullopt;
    }
    return std::string(*value);
}

}  // namespace hubpp
