#pragma once

#include "hubpp/async/cancellation.hpp"
#include "hubpp/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    std::string reason;  // "OK", "Internal Server Error", ...
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    // "500 Internal Server Error", or just "500" when the reason is unknown.
    [[nodiscard]] std::string status_text() const {
        const bool has_reason = (reason.empty() == false);
        if (has_reason) {
            return std::to_string(status_code) + " " + reason;
        }
        return std::to_string(status_code);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpBodyStream
// ─────────────────────────────────────────────────────────────────────────────
// A response whose body keeps arriving after the headers (text/event-stream).
// Status and headers are known once open_stream() returns.

class IHttpBodyStream {
public:
    virtual ~IHttpBodyStream() = default;

    [[nodiscard]] virtual int status_code() const noexcept = 0;

    // Block until the next body chunk arrives.
    // nullopt means the server ended the response.
    [[nodiscard]] virtual HttpClientResult<std::optional<std::string>> read_chunk() = 0;

    // Abort the transfer. A blocked read_chunk() returns Cancelled.
    // Safe to call from any thread, more than once.
    virtual void close() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// The HTTP capability the negotiate and SSE code needs. Absolute URLs are
// passed per request because negotiate, connect and send URLs all differ.
// Implemented on cpr; tests substitute a mock.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Applies to post() only. Streams stay open as long as the server wants.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    // Perform an HTTP POST and read the whole response. An empty
    // content_type sends no Content-Type header.
    // Firing token aborts the transfer with HttpClientError::Code::Cancelled.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        const CancellationToken& token = {}
    ) = 0;

    // Perform an HTTP GET and return once the response headers are in.
    [[nodiscard]] virtual HttpClientResult<std::unique_ptr<IHttpBodyStream>> open_stream(
        const std::string& url,
        const HeaderMap& headers,
        const CancellationToken& token = {}
    ) = 0;
};

// Creates the default HTTP client implementation (cpr).
std::shared_ptr<IHttpClient> make_http_client();

}  // namespace hubpp
