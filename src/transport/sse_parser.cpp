#include "hubpp/transport/sse_parser.hpp"

namespace hubpp {

HubResult<std::vector<SseEvent>> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    // Lines end in "\r\n", "\n" or a lone "\r".
    for (const char c : chunk) {
        if (skip_leading_lf_) {
            skip_leading_lf_ = false;
            if (c == '\n') {
                continue;
            }
        }

        const bool line_end = (c == '\n') || (c == '\r');
        if (line_end == false) {
            if (line_.size() >= config_.max_line_size) {
                reset();
                return tl::unexpected(HubError::protocol_error(
                    "SSE line exceeds " + std::to_string(config_.max_line_size) + " bytes"
                ));
            }
            line_.push_back(c);
            continue;
        }

        skip_leading_lf_ = (c == '\r');
        const LineResult result = take_line(line_);
        line_.clear();

        switch (result) {
            case LineResult::Continue:
                break;
            case LineResult::Dispatch:
                events.push_back(std::move(pending_));
                pending_ = SseEvent{};
                has_data_ = false;
                break;
            case LineResult::TooLarge:
                reset();
                return tl::unexpected(HubError::protocol_error(
                    "SSE event exceeds " + std::to_string(config_.max_event_size) + " bytes"
                ));
        }
    }

    return events;
}

void SseParser::reset() {
    line_.clear();
    skip_leading_lf_ = false;
    pending_ = SseEvent{};
    has_data_ = false;
}

SseParser::LineResult SseParser::take_line(std::string_view line) {
    if (line.empty()) {
        if (has_data_) {
            return LineResult::Dispatch;
        }
        // Blank line with no data: drop whatever fields were seen.
        pending_ = SseEvent{};
        return LineResult::Continue;
    }

    if (line.front() == ':') {
        return LineResult::Continue;  // comment / keep-alive
    }

    std::string_view name = line;
    std::string_view value;
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        name = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (value.starts_with(' ')) {
            value.remove_prefix(1);
        }
    }

    if (name == "data") {
        const std::size_t joined = pending_.data.size() + (has_data_ ? 1 : 0) + value.size();
        if (joined > config_.max_event_size) {
            return LineResult::TooLarge;
        }
        if (has_data_) {
            pending_.data.push_back('\n');
        }
        pending_.data.append(value);
        has_data_ = true;
    } else if (name == "event") {
        pending_.event = std::string(value);
    } else if (name == "id") {
        pending_.id = std::string(value);
    }
    // "retry" and unknown fields are ignored: this client never reconnects.

    return LineResult::Continue;
}

}  // namespace hubpp
