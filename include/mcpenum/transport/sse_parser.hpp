#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcpenum {

/// One Server-Sent Event.
///
///   event: <type>      (optional, defaults to "message")
///   id: <event-id>     (optional)
///   data: <payload>    (repeatable, joined with '\n')
///   <blank line>       (terminates the event)
///
/// Streamable HTTP servers answer a JSON-RPC POST with a short event stream
/// whose `message` events carry the response.
struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;

    [[nodiscard]] bool is_message() const {
        return (event.has_value() == false) || (*event == "message");
    }
};

class SseBufferOverflowError : public std::runtime_error {
public:
    SseBufferOverflowError(std::size_t size, std::size_t limit)
        : std::runtime_error("SSE buffer overflow: " + std::to_string(size) +
                             " bytes exceeds limit of " + std::to_string(limit))
    {}
};

struct SseParserConfig {
    std::size_t max_buffer_size{4 * 1024 * 1024};
    std::size_t max_event_size{4 * 1024 * 1024};
};

/// Incremental SSE parser. Feed chunks as they arrive; complete events are
/// returned as soon as their terminating blank line is seen.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Throws SseBufferOverflowError when buffered input exceeds the limit.
    [[nodiscard]] std::vector<SseEvent> feed(std::string_view chunk);

    /// End of stream: emit the pending event if the body ended without a
    /// trailing blank line (some servers close right after the last data line).
    [[nodiscard]] std::optional<SseEvent> finish();

    void reset();

private:
    void maybe_compact_buffer();
    bool process_line(std::string_view line);
    [[nodiscard]] bool has_pending_event() const noexcept;
    SseEvent emit_event();

    SseParserConfig config_;
    std::string buffer_;
    std::size_t buffer_pos_{0};
    std::string current_data_;
    bool current_has_data_{false};
    std::optional<std::string> current_id_;
    std::optional<std::string> current_event_;
};

/// Parse a complete SSE body (feed + finish)
[[nodiscard]] std::vector<SseEvent> parse_sse_body(std::string_view body, SseParserConfig config = {});

}  // namespace mcpenum
