#pragma once

#include "hubpp/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hubpp {

/// One dispatched Server-Sent Event.
///
/// Wire format (https://html.spec.whatwg.org/multipage/server-sent-events.html):
///   event: <type>      optional, "message" when absent
///   id: <id>           optional
///   data: <payload>    repeated lines are joined with '\n'
///   <blank line>       dispatches the event
///
/// A hub server sends one or more record-separated hub frames per event.
struct SseEvent {
    std::string event{"message"};
    std::string data;
    std::optional<std::string> id;
};

struct SseParserConfig {
    /// Bytes of an unterminated line the parser will hold.
    std::size_t max_line_size{1024 * 1024};

    /// Bytes of joined data lines for one event.
    std::size_t max_event_size{1024 * 1024};
};

/// Incremental text/event-stream parser.
///
/// The HTTP body arrives in arbitrary chunks; feed() keeps the partial line
/// and the event under construction between calls.
///
///   SseParser parser;
///   auto events = parser.feed(chunk);
///   if (!events) { /* oversized input */ }
///
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Returns the events completed by this chunk. Events without data are
    /// not dispatched. Exceeding a configured limit is a ProtocolError and
    /// leaves the parser reset.
    [[nodiscard]] HubResult<std::vector<SseEvent>> feed(std::string_view chunk);

    void reset();

    [[nodiscard]] std::size_t buffered() const noexcept { return line_.size(); }

private:
    enum class LineResult { Continue, Dispatch, TooLarge };

    LineResult take_line(std::string_view line);

    SseParserConfig config_;
    std::string line_;
    bool skip_leading_lf_{false};   // previous chunk ended with '\r'
    SseEvent pending_;
    bool has_data_{false};
};

}  // namespace hubpp
