#include "mcpenum/transport/sse_parser.hpp"

namespace mcpenum {

// Compact once this much of the buffer has been consumed
constexpr std::size_t buffer_compact_threshold = 4096;

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    const std::size_t new_size = buffer_.size() + chunk.size();
    if (new_size > config_.max_buffer_size) {
        throw SseBufferOverflowError(new_size, config_.max_buffer_size);
    }

    buffer_ += chunk;

    std::size_t newline_pos = 0;
    while ((newline_pos = buffer_.find('\n', buffer_pos_)) != std::string::npos) {
        std::string_view line_view(buffer_.data() + buffer_pos_, newline_pos - buffer_pos_);
        const bool has_carriage_return = (!line_view.empty()) && (line_view.back() == '\r');
        if (has_carriage_return) {
            line_view.remove_suffix(1);
        }
        buffer_pos_ = newline_pos + 1;

        const bool event_complete = process_line(line_view);
        if (event_complete == false) {
            continue;
        }
        if (current_data_.size() > config_.max_event_size) {
            // Oversized events are dropped, the stream continues
            (void)emit_event();
            continue;
        }
        if (has_pending_event()) {
            events.push_back(emit_event());
        } else {
            // Blank line with no data: nothing to dispatch, fields reset
            (void)emit_event();
        }
    }

    maybe_compact_buffer();
    return events;
}

std::optional<SseEvent> SseParser::finish() {
    // A final line without '\n' is still a line at end of stream
    const bool has_partial_line = (buffer_pos_ < buffer_.size());
    if (has_partial_line) {
        std::string_view line_view(buffer_.data() + buffer_pos_, buffer_.size() - buffer_pos_);
        if ((!line_view.empty()) && (line_view.back() == '\r')) {
            line_view.remove_suffix(1);
        }
        buffer_pos_ = buffer_.size();
        (void)process_line(line_view);
    }

    std::optional<SseEvent> event;
    const bool within_limit = (current_data_.size() <= config_.max_event_size);
    if (has_pending_event() && within_limit) {
        event = emit_event();
    }
    reset();
    return event;
}

void SseParser::maybe_compact_buffer() {
    if (buffer_pos_ > buffer_compact_threshold) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
}

void SseParser::reset() {
    buffer_.clear();
    buffer_pos_ = 0;
    current_data_.clear();
    current_has_data_ = false;
    current_id_ = std::nullopt;
    current_event_ = std::nullopt;
}

bool SseParser::has_pending_event() const noexcept {
    return current_has_data_;
}

bool SseParser::process_line(std::string_view line) {
    if (line.empty()) {
        return true;
    }

    const bool is_comment = (line.front() == ':');
    if (is_comment) {
        return false;
    }

    std::string_view field_name = line;
    std::string_view field_value;

    const std::size_t colon_pos = line.find(':');
    const bool has_colon = (colon_pos != std::string_view::npos);
    if (has_colon) {
        field_name = line.substr(0, colon_pos);
        std::size_t value_start = colon_pos + 1;
        const bool has_space_after_colon =
            (value_start < line.size()) && (line[value_start] == ' ');
        if (has_space_after_colon) {
            value_start += 1;
        }
        field_value = line.substr(value_start);
    }

    if (field_name == "event") {
        current_event_ = std::string(field_value);
    } else if (field_name == "id") {
        current_id_ = std::string(field_value);
    } else if (field_name == "data") {
        if (current_has_data_) {
            current_data_ += '\n';
        }
        current_data_ += field_value;
        current_has_data_ = true;
    }
    // "retry" only matters for reconnecting streams; ignored

    return false;
}

SseEvent SseParser::emit_event() {
    SseEvent event{
        std::move(current_id_),
        std::move(current_event_),
        std::move(current_data_)
    };

    current_data_.clear();
    current_has_data_ = false;
    current_id_ = std::nullopt;
    current_event_ = std::nullopt;
    return event;
}

std::vector<SseEvent> parse_sse_body(std::string_view body, SseParserConfig config) {
    SseParser parser(config);
    auto events = parser.feed(body);
    auto last = parser.finish();
    if (last.has_value()) {
        events.push_back(std::move(*last));
    }
    return events;
}

}  // namespace mcpenum
