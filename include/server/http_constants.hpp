#pragma once

#include <string>

namespace llmproxy::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kEventStreamContentType = "text/event-stream";

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kChatCompletionsPath = "/v1/chat/completions";
inline const std::string kChatCompletionsShortPath = "/chat/completions";

} // namespace llmproxy::http
