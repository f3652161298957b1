#include "provider/sse_parser.hpp"

namespace llmproxy {

namespace {
constexpr std::string_view kDoneSentinel = "[DONE]";
}

SseParser::SseParser(EventCallback on_event)
    : on_event_(std::move(on_event)) {}

void SseParser::feed(std::string_view bytes) {
    buffer_.append(bytes);

    size_t start = 0;
    size_t nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos) {
        std::string_view line(buffer_.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        process_line(line);
        start = nl + 1;
    }
    buffer_.erase(0, start);
}

void SseParser::finish() {
    if (!buffer_.empty()) {
        std::string rest = std::move(buffer_);
        buffer_.clear();
        if (!rest.empty() && rest.back() == '\r') rest.pop_back();
        process_line(rest);
    }
    dispatch();
}

void SseParser::process_line(std::string_view line) {
    if (line.empty()) {
        dispatch();
        return;
    }
    if (line.front() == ':') return;                // comment / keep-alive

    const auto colon = line.find(':');
    const std::string_view field = line.substr(0, colon);
    if (field != "data") return;

    std::string_view value;
    if (colon != std::string_view::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    }

    if (has_data_) data_ += '\n';
    data_.append(value);
    has_data_ = true;
}

void SseParser::dispatch() {
    if (!has_data_) return;
    has_data_ = false;
    const std::string data = std::move(data_);
    data_.clear();

    if (data == kDoneSentinel) {
        done_ = true;
        return;
    }
    ++events_;
    on_event_(data);
}

} // namespace llmproxy
