#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace hubpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Frame-level detail
    Debug = 1,  // Lifecycle transitions
    Info  = 2,  // Transport selection, connection events
    Warn  = 3,  // Recoverable problems
    Error = 4,  // Failed operations
    Off   = 5   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    constexpr std::array<std::string_view, 6> names{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
    const auto index = static_cast<std::size_t>(level);
    return (index < names.size()) ? names[index] : "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────
// Backends implement log() and should_log(). write() and logf() check the
// level first, so a disabled level never formats.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            emit(level, std::string(msg), loc);
        }
    }

    // get_logger().logf(LogLevel::Debug, "Hub connection {}: {}", id, state)
    template<typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            emit(level, std::format(fmt, std::forward<Args>(args)...), std::source_location::current());
        }
    }

private:
    void emit(LogLevel level, std::string message, std::source_location loc) {
        log(LogRecord{level, std::move(message), std::chrono::system_clock::now(), loc});
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - the default; the library is silent until a backend is set
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership. Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// HUBPP_LOG(Trace, "...") skips the call entirely below the logger's level.
#define HUBPP_LOG(level, msg) \
    do { \
        auto& hubpp_logger_ = ::hubpp::get_logger(); \
        if (hubpp_logger_.should_log(::hubpp::LogLevel::level)) { \
            hubpp_logger_.write(::hubpp::LogLevel::level, msg); \
        } \
    } while (false)

}  // namespace hubpp
