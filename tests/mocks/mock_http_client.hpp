#ifndef HUBPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define HUBPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "hubpp/transport/http_client.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hubpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockBodyStream - scripted streaming response
// ─────────────────────────────────────────────────────────────────────────────
// Hands out the queued chunks in order. Afterwards it either reports end of
// body, or (hold_open) blocks until close() like a live event stream.

struct MockStreamState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    bool hold_open{false};
    bool closed{false};
};

class MockBodyStream final : public IHttpBodyStream {
public:
    MockBodyStream(int status_code, std::shared_ptr<MockStreamState> state)
        : status_code_(status_code)
        , state_(std::move(state))
    {}

    [[nodiscard]] int status_code() const noexcept override {
        return status_code_;
    }

    HttpClientResult<std::optional<std::string>> read_chunk() override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this]() {
            return state_->closed || !state_->chunks.empty() || !state_->hold_open;
        });
        if (state_->closed) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (state_->chunks.empty()) {
            return std::optional<std::string>();
        }
        std::string chunk = std::move(state_->chunks.front());
        state_->chunks.pop_front();
        return std::optional<std::string>(std::move(chunk));
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

private:
    int status_code_;
    std::shared_ptr<MockStreamState> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Queue canned POST responses and streams
// - Inspect every request that was made
// - Simulate transport errors and requests that never complete

struct RecordedRequest {
    HttpMethod method;
    std::string url;
    std::string body;
    std::string content_type;
    HeaderMap headers;
};

class MockHttpClient final : public IHttpClient {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const std::string& reason = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse queued;
        queued.result = HttpClientResponse{status_code, reason, {}, body};
        responses_.push_back(std::move(queued));
    }

    void queue_json_response(const std::string& body) {
        queue_response(200, body, "OK");
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse queued;
        queued.error = HttpClientError{code, message};
        responses_.push_back(std::move(queued));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    /// post() waits until its token is cancelled, like a request the server
    /// never answers.
    void block_posts(bool block = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        block_posts_ = block;
    }

    /// The next open_stream() returns these chunks. Returns the shared state
    /// so tests can push more data or check that the stream was closed.
    std::shared_ptr<MockStreamState> queue_stream(
        int status_code,
        std::vector<std::string> chunks,
        bool hold_open = false
    ) {
        auto state = std::make_shared<MockStreamState>();
        state->chunks.assign(chunks.begin(), chunks.end());
        state->hold_open = hold_open;

        std::lock_guard<std::mutex> lock(mutex_);
        streams_.push_back({status_code, state});
        return state;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        const CancellationToken& token = {}
    ) override {
        // Registered before locking: it may run right away on this thread.
        auto registration = token.on_cancel([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back({HttpMethod::Post, url, body, content_type, headers});
        cv_.notify_all();

        if (block_posts_) {
            cv_.wait(lock, [&token]() { return token.is_cancelled(); });
        }
        if (token.is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (responses_.empty()) {
            return HttpClientResponse{200, "OK", {}, ""};
        }

        auto queued = std::move(responses_.front());
        responses_.pop_front();
        if (queued.error.has_value()) {
            return tl::unexpected(*queued.error);
        }
        return *queued.result;
    }

    HttpClientResult<std::unique_ptr<IHttpBodyStream>> open_stream(
        const std::string& url,
        const HeaderMap& headers,
        const CancellationToken& token = {}
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({HttpMethod::Get, url, "", "", headers});

        if (token.is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (streams_.empty()) {
            return tl::unexpected(HttpClientError::connection_failed("No stream queued"));
        }

        auto queued = std::move(streams_.front());
        streams_.pop_front();
        return std::unique_ptr<IHttpBodyStream>(
            std::make_unique<MockBodyStream>(queued.status_code, std::move(queued.state))
        );
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    struct QueuedStream {
        int status_code;
        std::shared_ptr<MockStreamState> state;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool block_posts_{false};
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};

    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> responses_;
    std::deque<QueuedStream> streams_;
};

}  // namespace hubpp::testing

#endif  // HUBPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
