#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace llmproxy {

/// Placeholder written in place of a credential in anything persisted or logged
inline constexpr const char* kRedactedApiKey = "sk-redacted";

/**
 * @brief Chat-completion call parameters: typed known fields plus an open
 * extension map.
 *
 * Known fields are validated strictly by from_json(). Every other key lands in
 * `extra` and is passed through to the provider untouched. A JSON null for
 * any key is treated as absent, so it never shadows a route or global default.
 */
struct ChatParams {
    std::optional<std::string> model;
    nlohmann::json messages;                 // null when absent
    std::optional<bool> stream;
    std::optional<double> temperature;
    std::optional<int64_t> max_tokens;
    std::optional<double> timeout;           // seconds
    std::optional<int64_t> num_retries;
    std::optional<std::string> api_key;
    nlohmann::json extra = nlohmann::json::object();

    /**
     * @brief Parse a client request body
     * @return INVALID_REQUEST when the body is not an object or a known field
     *         has the wrong type
     */
    [[nodiscard]] static Result<ChatParams> from_json(const nlohmann::json& body);

    /// Provider call parameters (credential included, nulls dropped)
    [[nodiscard]] nlohmann::json to_json() const;

    /// Same as to_json() with the credential replaced by kRedactedApiKey
    [[nodiscard]] nlohmann::json to_log_json() const;

    [[nodiscard]] bool is_streaming() const { return stream.value_or(false); }

    /// True if `key` is set to a non-null value, known field or extension
    [[nodiscard]] bool has(std::string_view key) const;
};

} // namespace llmproxy
