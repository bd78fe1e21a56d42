#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation Scope
// ═══════════════════════════════════════════════════════════════════════════
// A CancellationSource owns one shared flag; any number of CancellationTokens
// observe it. Callbacks registered on a token run once, on the thread that
// calls cancel(), and are unregistered when their registration handle dies.
//
// run_cancellable() is the worker-per-call primitive used by HubConnection:
// the blocking work runs on its own thread, the caller waits for either the
// result or the cancellation signal, and the worker is always joined before
// run_cancellable() returns.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace hubpp {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
    std::uint64_t next_id{1};

    // Returns 0 when the callback was run immediately (already cancelled).
    std::uint64_t add(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            const bool already = cancelled.load(std::memory_order_acquire);
            if (already == false) {
                const std::uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::erase_if(callbacks, [id](const auto& entry) { return entry.first == id; });
    }

    void trigger() {
        std::vector<std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const bool was_cancelled = cancelled.exchange(true, std::memory_order_acq_rel);
            if (was_cancelled) {
                return;
            }
            for (auto& [id, callback] : callbacks) {
                to_run.push_back(std::move(callback));
            }
            callbacks.clear();
        }
        for (auto& callback : to_run) {
            callback();
        }
    }
};

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CancellationRegistration - unregisters its callback on destruction
// ─────────────────────────────────────────────────────────────────────────────

class CancellationRegistration {
public:
    CancellationRegistration() = default;

    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state))
        , id_(id)
    {}

    ~CancellationRegistration() { reset(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(std::exchange(other.id_, 0))
    {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    void reset() {
        if (state_ && id_ != 0) {
            state_->remove(id_);
        }
        state_.reset();
        id_ = 0;
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// CancellationToken - copyable observer; default-constructed never fires
// ─────────────────────────────────────────────────────────────────────────────

class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    // Runs callback immediately if the token is already cancelled.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const {
        if (!state_) {
            return {};
        }
        const std::uint64_t id = state_->add(std::move(callback));
        return CancellationRegistration(state_, id);
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state))
    {}

    std::shared_ptr<detail::CancellationState> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CancellationSource - owns the scope
// ─────────────────────────────────────────────────────────────────────────────

class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>())
    {}

    [[nodiscard]] CancellationToken token() const noexcept {
        return CancellationToken(state_);
    }

    // Idempotent. Callbacks run on the calling thread.
    void cancel() {
        state_->trigger();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// run_cancellable
// ─────────────────────────────────────────────────────────────────────────────
// Runs work on a dedicated thread and waits for whichever comes first: its
// result, or the token firing. Returns nullopt when cancellation won.
// Either way the worker has finished before this returns; an abandoned
// result is drained and dropped. If the token is already cancelled no
// worker is started.

template <typename Work>
[[nodiscard]] std::optional<std::invoke_result_t<Work>> run_cancellable(
    const CancellationToken& token,
    Work&& work
) {
    using Result = std::invoke_result_t<Work>;

    if (token.is_cancelled()) {
        return std::nullopt;
    }

    struct Signal {
        std::mutex mutex;
        std::condition_variable cv;
        bool done{false};
        bool cancelled{false};
    };
    auto signal = std::make_shared<Signal>();

    std::future<Result> pending = std::async(
        std::launch::async,
        [signal, work = std::forward<Work>(work)]() mutable -> Result {
            // Flag completion even if work throws; the future rethrows.
            struct MarkDone {
                Signal& s;
                ~MarkDone() {
                    {
                        std::lock_guard<std::mutex> lock(s.mutex);
                        s.done = true;
                    }
                    s.cv.notify_all();
                }
            } mark{*signal};
            return work();
        }
    );

    auto registration = token.on_cancel([signal]() {
        {
            std::lock_guard<std::mutex> lock(signal->mutex);
            signal->cancelled = true;
        }
        signal->cv.notify_all();
    });

    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(signal->mutex);
        signal->cv.wait(lock, [&signal]() { return signal->done || signal->cancelled; });
        cancelled = signal->cancelled;
    }
    registration.reset();

    if (cancelled) {
        // Join the worker before reporting; its result is discarded.
        pending.wait();
        return std::nullopt;
    }
    return pending.get();
}

}  // namespace hubpp
