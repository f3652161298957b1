#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmproxy {

// ============================================================================
// Model Routing
// ============================================================================

/// Prefix marking a credential reference resolved from the environment
inline constexpr std::string_view kEnvSecretPrefix = "os.environ/";

/**
 * @brief One client-visible model alias and the call parameters behind it.
 *
 * Built wholesale from the [[models]] config entries; a table of routes is
 * replaced as a unit on reload and never mutated while requests read it.
 */
struct ModelRoute {
    std::string alias;                  // client-facing name (unique)
    std::string provider_model;         // e.g. "openai/gpt-4.1", opaque to the proxy
    std::string api_key_ref;            // "os.environ/VAR" or a literal key, empty = none
    bool enabled = true;

    std::optional<double> timeout;      // seconds
    std::optional<int64_t> num_retries;
    std::optional<double> temperature;
    std::optional<int64_t> max_tokens;

    // Any other key in the entry, passed through to the provider as-is
    nlohmann::json extra_params = nlohmann::json::object();

    // Pricing metadata, never forwarded
    std::optional<double> input_cost_per_million;
    std::optional<double> output_cost_per_million;
};

/// Upper bounds accepted for per-call timeout (seconds) and retry count
inline constexpr double kMaxTimeoutSeconds = 86400.0;
inline constexpr int64_t kMaxNumRetries = 10;

/// Process-wide parameter defaults, applied after route and client values
struct GlobalDefaults {
    double timeout = 120.0;             // seconds
    int64_t num_retries = 3;
};

// ============================================================================
// Usage Ledger
// ============================================================================

/**
 * @brief One recorded proxy attempt.
 *
 * Exactly one is written per client-visible request. When `error` is set the
 * token and cost fields are zero.
 */
struct LedgerRecord {
    std::string timestamp;              // UTC, "YYYY-MM-DDTHH:MM:SS.ffffff"
    std::string model;                  // client alias ("unknown" when absent)
    std::string provider;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
    double cost = 0.0;
    int64_t duration_ms = 0;
    std::string request_data;           // serialized params, api_key redacted
    std::optional<std::string> response_data;
    std::optional<std::string> error;
};

} // namespace llmproxy
