#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace llmproxy {

/**
 * @brief Incremental text/event-stream decoder.
 *
 * Bytes may be fed in arbitrary slices. Each complete event's `data:` lines
 * (joined with '\n') are delivered to the callback; comment lines and other
 * fields are ignored. Accepts both "\n" and "\r\n" line endings.
 */
class SseParser {
public:
    using EventCallback = std::function<void(std::string_view data)>;

    explicit SseParser(EventCallback on_event);

    void feed(std::string_view bytes);

    /// Dispatch a trailing event not terminated by a blank line
    void finish();

    /// True once a "[DONE]" sentinel event was seen
    [[nodiscard]] bool done() const { return done_; }

    [[nodiscard]] size_t events() const { return events_; }

private:
    void process_line(std::string_view line);
    void dispatch();

    EventCallback on_event_;
    std::string buffer_;
    std::string data_;
    bool has_data_ = false;
    bool done_ = false;
    size_t events_ = 0;
};

} // namespace llmproxy
