#include "hubpp/transport/http_client.hpp"
#include "hubpp/log/logger.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <charconv>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace hubpp {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

cpr::Header to_cpr_headers(const HeaderMap& headers) {
    cpr::Header cpr_headers;
    for (const auto& [name, value] : headers) {
        cpr_headers[name] = value;
    }
    return cpr_headers;
}

HttpClientError map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);

    if (is_ssl_error) {
        return HttpClientError::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OK:
            return HttpClientError::unknown("No error");

        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return HttpClientError::timeout(msg);

        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return HttpClientError::ssl_error(msg);

        default:
            return HttpClientError::connection_failed(msg);
    }
}

std::string_view trim(std::string_view value) {
    while (value.empty() == false && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (value.empty() == false &&
           (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }
    return value;
}

// ─────────────────────────────────────────────────────────────────────────────
// CprBodyStream
// ─────────────────────────────────────────────────────────────────────────────
// Runs one cpr::Get on a private thread. The header callback records the
// status line and headers; the write callback queues body chunks; the
// progress callback lets close() abort a transfer that is idle.

class CprBodyStream final : public IHttpBodyStream {
public:
    CprBodyStream(
        std::string url,
        HeaderMap headers,
        std::chrono::milliseconds connect_timeout,
        bool verify_ssl
    ) {
        worker_ = std::thread([this, url = std::move(url), headers = std::move(headers),
                               connect_timeout, verify_ssl]() {
            run(url, headers, connect_timeout, verify_ssl);
        });
    }

    ~CprBodyStream() override {
        close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    CprBodyStream(const CprBodyStream&) = delete;
    CprBodyStream& operator=(const CprBodyStream&) = delete;

    // Wait until the headers are complete or the transfer ended early.
    // Returns the transfer error if there never was a response.
    HttpClientResult<void> wait_for_headers() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() {
            return headers_done_ || finished_ || closed_.load();
        });
        if (headers_done_) {
            return {};
        }
        if (error_.has_value()) {
            return tl::unexpected(*error_);
        }
        return tl::unexpected(HttpClientError::cancelled());
    }

    [[nodiscard]] int status_code() const noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_code_;
    }

    HttpClientResult<std::optional<std::string>> read_chunk() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() {
            return (chunks_.empty() == false) || finished_ || closed_.load();
        });

        const bool has_chunk = (chunks_.empty() == false);
        if (has_chunk) {
            std::string chunk = std::move(chunks_.front());
            chunks_.pop_front();
            return std::optional<std::string>(std::move(chunk));
        }
        if (closed_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (error_.has_value()) {
            return tl::unexpected(*error_);
        }
        return std::optional<std::string>();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.store(true);
        }
        cv_.notify_all();
    }

private:
    void run(
        const std::string& url,
        const HeaderMap& headers,
        std::chrono::milliseconds connect_timeout,
        bool verify_ssl
    ) {
        std::optional<HttpClientError> failure;
        try {
            auto response = cpr::Get(
                cpr::Url{url},
                to_cpr_headers(headers),
                cpr::HeaderCallback{[this](std::string_view line, intptr_t) {
                    return on_header(line);
                }},
                cpr::WriteCallback{[this](std::string_view data, intptr_t) {
                    return on_data(data);
                }},
                cpr::ProgressCallback{[this](auto, auto, auto, auto, intptr_t) {
                    return closed_.load() == false;
                }},
                cpr::ConnectTimeout{connect_timeout},
                cpr::VerifySsl{verify_ssl}
            );
            const bool has_error = (response.error.code != cpr::ErrorCode::OK);
            if (has_error && closed_.load() == false) {
                failure = map_error(response.error);
            }
        } catch (const std::exception& e) {
            failure = HttpClientError::unknown(e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
            error_ = std::move(failure);
        }
        cv_.notify_all();
    }

    bool on_header(std::string_view line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const bool is_status_line = line.starts_with("HTTP/");
            if (is_status_line) {
                // New response (a redirect or 100-continue resets the state).
                status_code_ = parse_status(line);
                headers_.clear();
            } else if (trim(line).empty()) {
                const bool is_final = (status_code_ >= 200);
                if (is_final) {
                    headers_done_ = true;
                }
            } else {
                const auto colon = line.find(':');
                if (colon != std::string_view::npos) {
                    headers_[std::string(trim(line.substr(0, colon)))] =
                        std::string(trim(line.substr(colon + 1)));
                }
            }
        }
        cv_.notify_all();
        return closed_.load() == false;
    }

    bool on_data(std::string_view data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunks_.emplace_back(data);
        }
        cv_.notify_all();
        return closed_.load() == false;
    }

    static int parse_status(std::string_view status_line) {
        // "HTTP/1.1 200 OK"
        const auto space = status_line.find(' ');
        if (space == std::string_view::npos) {
            return 0;
        }
        const auto code = status_line.substr(space + 1, 3);
        int status = 0;
        std::from_chars(code.data(), code.data() + code.size(), status);
        return status;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    HeaderMap headers_;
    int status_code_{0};
    bool headers_done_{false};
    bool finished_{false};
    std::optional<HttpClientError> error_;
    std::atomic<bool> closed_{false};
    std::thread worker_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class CprHttpClient final : public IHttpClient {
public:
    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        const CancellationToken& token
    ) override {
        if (token.is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto request_headers = to_cpr_headers(headers);
        if (content_type.empty() == false) {
            request_headers["Content-Type"] = content_type;
        }

        cpr::Response response;
        try {
            response = cpr::Post(
                cpr::Url{url},
                request_headers,
                cpr::Body{body},
                cpr::ConnectTimeout{connect_timeout_},
                cpr::Timeout{read_timeout_},
                cpr::VerifySsl{verify_ssl_},
                cpr::ProgressCallback{[&token](auto, auto, auto, auto, intptr_t) {
                    return token.is_cancelled() == false;
                }}
            );
        } catch (const std::exception& e) {
            return tl::unexpected(HttpClientError::unknown(e.what()));
        }

        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            if (token.is_cancelled()) {
                return tl::unexpected(HttpClientError::cancelled());
            }
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.reason = response.reason;
        result.body = std::move(response.text);
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    HttpClientResult<std::unique_ptr<IHttpBodyStream>> open_stream(
        const std::string& url,
        const HeaderMap& headers,
        const CancellationToken& token
    ) override {
        if (token.is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto stream = std::make_unique<CprBodyStream>(url, headers, connect_timeout_, verify_ssl_);
        auto* raw = stream.get();
        auto registration = token.on_cancel([raw]() { raw->close(); });

        auto ready = stream->wait_for_headers();
        registration.reset();
        if (!ready) {
            return tl::unexpected(ready.error());
        }

        get_logger().logf(LogLevel::Debug, "Stream opened with status {}", stream->status_code());
        return std::unique_ptr<IHttpBodyStream>(std::move(stream));
    }

private:
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};
};

}  // namespace

std::shared_ptr<IHttpClient> make_http_client() {
    return std::make_shared<CprHttpClient>();
}

}  // namespace hubpp
