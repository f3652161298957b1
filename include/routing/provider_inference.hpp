#pragma once

#include <string>
#include <string_view>

namespace llmproxy {

inline constexpr const char* kUnknownProvider = "unknown";

/**
 * @brief Provider tag for a model identifier.
 *
 * An explicit "<provider>/..." prefix wins. Otherwise well-known name
 * families are matched case-insensitively (gpt-/o1- -> openai,
 * *claude* -> anthropic, gemini/palm -> gemini, mistral, llama -> meta).
 * Returns "unknown" when nothing matches.
 */
[[nodiscard]] std::string infer_provider_from_model(std::string_view model);

/// "openai/gpt-4.1" -> "gpt-4.1"; identifiers without a prefix are returned as-is
[[nodiscard]] std::string strip_provider_prefix(std::string_view model);

} // namespace llmproxy
