#pragma once

#include "core/types.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmproxy {

// ============================================================================
// Section configs (mirror the TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 4000;
    size_t thread_pool_size = 8;
    uint32_t shutdown_timeout_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct LedgerConfig {
    std::string path = "requests.db";
    int busy_timeout_ms = 5000;
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

// ============================================================================
// ProxyConfig - Complete parsed configuration
// ============================================================================

struct ProxyConfig {
    ServerConfig server;
    LoggingConfig logging;
    LedgerConfig ledger;
    GlobalDefaults defaults;
    ConfigWatcherConfig config_watcher;

    // [providers.<tag>] api_base overrides
    std::unordered_map<std::string, std::string> provider_api_bases;

    // [[models]] entries that passed validation, in file order
    std::vector<ModelRoute> models;

    // Skipped model entries and other non-fatal findings (already logged)
    std::vector<std::string> warnings;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief TOML configuration loader (toml++).
 *
 * Supports `${VAR}` expansion in every string value and
 * `include = ["other.toml"]` merging (main file wins, arrays concatenate).
 * A malformed [[models]] entry is skipped with a warning and the remaining
 * entries still load; section-level problems fail the whole load.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ProxyConfig config;

        static LoadResult ok(ProxyConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to proxy.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Section-level validation; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ProxyConfig& config);

private:
    static ProxyConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ProxyConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static LedgerConfig extract_ledger(const toml::table& root);
    static GlobalDefaults extract_defaults(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static std::unordered_map<std::string, std::string> extract_providers(const toml::table& root);
    static std::vector<ModelRoute> extract_models(const toml::table& root,
                                                  std::vector<std::string>& warnings);
};

} // namespace llmproxy
