#ifndef HUBPP_ERROR_HPP
#define HUBPP_ERROR_HPP

#include "hubpp/transport/http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// Hub Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct HubError {
    enum class Code {
        ConnectionFailed,    // Could not reach the server
        Timeout,             // Request or dial timed out
        SslError,            // TLS handshake or verification failed
        HttpError,           // Server returned a non-200 status
        ParseError,          // Malformed JSON (negotiate body or hub frame)
        InvalidUrl,          // Address could not be parsed or rewritten
        NegotiationFailed,   // Server answered negotiate with an error
        ProtocolError,       // Frame parsed but is not a valid hub message
        Io,                  // Read/write on an established connection failed
        Closed,              // Peer ended the stream
        Cancelled            // Cancellation scope fired
    };

    Code code;
    std::string message;
    std::optional<int> http_status;

    static HubError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt};
    }

    static HubError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt};
    }

    static HubError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt};
    }

    static HubError http_error(int status, const std::string& msg) {
        return {Code::HttpError, msg, status};
    }

    static HubError parse_error(const std::string& msg) {
        return {Code::ParseError, msg, std::nullopt};
    }

    static HubError invalid_url(const std::string& url) {
        return {Code::InvalidUrl, "Invalid URL: " + url, std::nullopt};
    }

    static HubError negotiation_failed(const std::string& msg) {
        return {Code::NegotiationFailed, msg, std::nullopt};
    }

    static HubError protocol_error(const std::string& msg) {
        return {Code::ProtocolError, msg, std::nullopt};
    }

    static HubError io(const std::string& msg) {
        return {Code::Io, msg, std::nullopt};
    }

    static HubError closed(const std::string& msg = "Connection closed") {
        return {Code::Closed, msg, std::nullopt};
    }

    static HubError cancelled() {
        return {Code::Cancelled, "Operation cancelled", std::nullopt};
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return code == Code::Cancelled;
    }

    static HubError from_client_error(const HttpClientError& err) {
        switch (err.code) {
            case HttpClientError::Code::ConnectionFailed:
                return connection_failed(err.message);
            case HttpClientError::Code::Timeout:
                return timeout(err.message);
            case HttpClientError::Code::SslError:
                return ssl_error(err.message);
            case HttpClientError::Code::Cancelled:
                return cancelled();
            default:
                return connection_failed(err.message);
        }
    }
};

[[nodiscard]] constexpr std::string_view to_string(HubError::Code code) noexcept {
    switch (code) {
        case HubError::Code::ConnectionFailed:  return "ConnectionFailed";
        case HubError::Code::Timeout:           return "Timeout";
        case HubError::Code::SslError:          return "SslError";
        case HubError::Code::HttpError:         return "HttpError";
        case HubError::Code::ParseError:        return "ParseError";
        case HubError::Code::InvalidUrl:        return "InvalidUrl";
        case HubError::Code::NegotiationFailed: return "NegotiationFailed";
        case HubError::Code::ProtocolError:     return "ProtocolError";
        case HubError::Code::Io:                return "Io";
        case HubError::Code::Closed:            return "Closed";
        case HubError::Code::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

template <typename T>
using HubResult = tl::expected<T, HubError>;

}  // namespace hubpp

#endif  // HUBPP_ERROR_HPP
