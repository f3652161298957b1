#include "config/config_loader.hpp"
#include "routing/model_route_table.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace llmproxy {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, val] : *tbl) expand_env_vars_in_node(val);
    } else if (auto* arr = node.as_array()) {
        expand_env_vars_in_array(*arr);
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) expand_env_vars_in_node(elem);
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars; arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {} (possible circular include)", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) paths.emplace_back(item.as_string()->get());
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in_node(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_in_node(result);
    return result;
}

// ---- Model entries ---------------------------------------------------------

nlohmann::json toml_to_json(const toml::node& node) {
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean()) return b->get();
    if (const auto* arr = node.as_array()) {
        auto out = nlohmann::json::array();
        for (const auto& elem : *arr) out.push_back(toml_to_json(elem));
        return out;
    }
    if (const auto* tbl = node.as_table()) {
        auto out = nlohmann::json::object();
        for (const auto& [key, val] : *tbl) out[std::string(key.str())] = toml_to_json(val);
        return out;
    }

    std::ostringstream os;
    if (const auto* d = node.as_date()) os << d->get();
    else if (const auto* t = node.as_time()) os << t->get();
    else if (const auto* dt = node.as_date_time()) os << dt->get();
    return os.str();
}

// Keys with typed handling; anything else becomes a pass-through parameter
bool is_typed_model_key(std::string_view key) {
    return key == "timeout" || key == "num_retries" || key == "temperature"
        || key == "max_tokens" || ModelRouteTable::is_reserved_key(key);
}

/**
 * @brief Build one route from a [[models]] entry.
 * @return nullopt with `error` set when the entry must be skipped
 */
std::optional<ModelRoute> parse_model_entry(const toml::table& m, std::string& error,
                                            std::vector<std::string>& warnings) {
    ModelRoute route;

    const auto name = m["model_name"].value<std::string>();
    if (!name || name->empty()) {
        error = "Model entry missing 'model_name' field";
        return std::nullopt;
    }
    route.alias = *name;

    const auto model = m["model"].value<std::string>();
    if (!model || model->empty()) {
        error = std::format("Model '{}': model - field required", route.alias);
        return std::nullopt;
    }
    route.provider_model = *model;

    if (m.contains("api_key")) {
        const auto key = m["api_key"].value<std::string>();
        if (!key || !key->starts_with(kEnvSecretPrefix)) {
            error = std::format("Model '{}': api_key - must be in format 'os.environ/VAR_NAME'", route.alias);
            return std::nullopt;
        }
        route.api_key_ref = *key;

        const std::string var = key->substr(kEnvSecretPrefix.size());
        if (std::getenv(var.c_str()) == nullptr) {
            warnings.push_back(std::format(
                "Environment variable {} not set. Requests using '{}' will fail with authentication error.",
                var, route.alias));
        }
    }

    if (m.contains("enabled")) {
        const auto enabled = m["enabled"].value<bool>();
        if (!enabled) {
            error = std::format("Model '{}': enabled - must be a boolean", route.alias);
            return std::nullopt;
        }
        route.enabled = *enabled;
    }

    if (m.contains("timeout")) {
        const auto timeout = m["timeout"].value<double>();
        if (!timeout || *timeout <= 0.0 || *timeout > kMaxTimeoutSeconds) {
            error = std::format("Model '{}': timeout - must be a positive number up to {}",
                                route.alias, kMaxTimeoutSeconds);
            return std::nullopt;
        }
        route.timeout = *timeout;
    }

    if (m.contains("num_retries")) {
        const auto retries = m["num_retries"].value_exact<int64_t>();
        if (!retries || *retries < 0 || *retries > kMaxNumRetries) {
            error = std::format("Model '{}': num_retries - must be an integer between 0 and {}",
                                route.alias, kMaxNumRetries);
            return std::nullopt;
        }
        route.num_retries = *retries;
    }

    if (m.contains("temperature")) {
        const auto temperature = m["temperature"].value<double>();
        if (!temperature) {
            error = std::format("Model '{}': temperature - must be a number", route.alias);
            return std::nullopt;
        }
        route.temperature = *temperature;
    }

    if (m.contains("max_tokens")) {
        const auto max_tokens = m["max_tokens"].value_exact<int64_t>();
        if (!max_tokens || *max_tokens <= 0) {
            error = std::format("Model '{}': max_tokens - must be a positive integer", route.alias);
            return std::nullopt;
        }
        route.max_tokens = *max_tokens;
    }

    // Pricing: per-million preferred, per-token accepted
    const auto price = [&](const char* per_million, const char* per_token) -> std::optional<double> {
        if (const auto v = m[per_million].value<double>()) return *v;
        if (const auto v = m[per_token].value<double>()) return *v * 1'000'000.0;
        return std::nullopt;
    };
    route.input_cost_per_million = price("input_cost_per_million", "input_cost_per_token");
    route.output_cost_per_million = price("output_cost_per_million", "output_cost_per_token");
    if ((route.input_cost_per_million && *route.input_cost_per_million < 0.0)
        || (route.output_cost_per_million && *route.output_cost_per_million < 0.0)) {
        error = std::format("Model '{}': pricing - costs must be non-negative", route.alias);
        return std::nullopt;
    }

    for (const auto& [key, val] : m) {
        const std::string k(key.str());
        if (is_typed_model_key(k)) continue;
        if (k == "stream" || k == "messages") {
            warnings.push_back(std::format(
                "Model '{}': '{}' is set by each request and cannot be configured per model; ignored",
                route.alias, k));
            continue;
        }
        route.extra_params[k] = toml_to_json(val);
    }

    return route;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{4000}));
    const auto threads = s["threads"].value_or(int64_t{8});
    if (threads <= 0) {
        throw std::runtime_error(std::format("server.threads must be > 0, got {}", threads));
    }
    cfg.thread_pool_size = static_cast<size_t>(threads);
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(s["shutdown_timeout_ms"].value_or(int64_t{30000}));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

LedgerConfig ConfigLoader::extract_ledger(const toml::table& root) {
    LedgerConfig cfg;
    if (const auto* ledger = root["ledger"].as_table()) {
        cfg.path = (*ledger)["path"].value_or("requests.db"s);
        cfg.busy_timeout_ms = static_cast<int>((*ledger)["busy_timeout_ms"].value_or(int64_t{5000}));
    }
    return cfg;
}

GlobalDefaults ConfigLoader::extract_defaults(const toml::table& root) {
    GlobalDefaults cfg;
    if (const auto* defaults = root["defaults"].as_table()) {
        cfg.timeout = (*defaults)["timeout"].value_or(cfg.timeout);
        cfg.num_retries = (*defaults)["num_retries"].value_or(cfg.num_retries);
    }
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    if (const auto* watcher = root["config_watcher"].as_table()) {
        cfg.enabled = (*watcher)["enabled"].value_or(true);
        cfg.poll_interval_seconds = static_cast<int>((*watcher)["poll_interval_seconds"].value_or(int64_t{5}));
    }
    return cfg;
}

std::unordered_map<std::string, std::string> ConfigLoader::extract_providers(const toml::table& root) {
    std::unordered_map<std::string, std::string> bases;
    const auto* providers = root["providers"].as_table();
    if (!providers) return bases;

    for (const auto& [tag, node] : *providers) {
        const auto* p = node.as_table();
        if (!p) continue;
        if (auto base = (*p)["api_base"].value<std::string>(); base && !base->empty()) {
            bases.emplace(std::string(tag.str()), std::move(*base));
        }
    }
    return bases;
}

std::vector<ModelRoute> ConfigLoader::extract_models(const toml::table& root,
                                                     std::vector<std::string>& warnings) {
    std::vector<ModelRoute> routes;
    const auto* models = root["models"].as_array();
    if (!models) return routes;

    for (const auto& node : *models) {
        const auto* entry = node.as_table();
        if (!entry) {
            warnings.emplace_back("Model entry must be a table");
            continue;
        }
        std::string error;
        auto route = parse_model_entry(*entry, error, warnings);
        if (!route) {
            warnings.push_back(std::move(error));
            continue;
        }
        routes.push_back(std::move(*route));
    }
    return routes;
}

ProxyConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ProxyConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.ledger = extract_ledger(tbl);
    config.defaults = extract_defaults(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.provider_api_bases = extract_providers(tbl);
    config.models = extract_models(tbl, config.warnings);

    if (!config.warnings.empty()) {
        utils::log::warn("Configuration validation errors:");
        for (const auto& w : config.warnings) utils::log::warn(std::format("  - {}", w));
    }
    if (config.models.empty()) {
        utils::log::warn("No valid models found in configuration");
    }
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ProxyConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        auto result = validate_and_return(extract_all_sections(tbl));
        if (result.success) {
            utils::log::info(std::format("Loaded {} model(s) from {}",
                                         result.config.models.size(), config_path));
        }
        return result;
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ProxyConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.emplace_back("server.threads must be > 0");
    }
    if (config.ledger.path.empty()) {
        errors.emplace_back("ledger.path must not be empty");
    }
    if (config.ledger.busy_timeout_ms < 0) {
        errors.emplace_back("ledger.busy_timeout_ms must be >= 0");
    }
    if (config.defaults.timeout <= 0.0 || config.defaults.timeout > kMaxTimeoutSeconds) {
        errors.push_back(std::format("defaults.timeout must be in (0, {}], got {}",
                                     kMaxTimeoutSeconds, config.defaults.timeout));
    }
    if (config.defaults.num_retries < 0 || config.defaults.num_retries > kMaxNumRetries) {
        errors.push_back(std::format("defaults.num_retries must be 0-{}, got {}",
                                     kMaxNumRetries, config.defaults.num_retries));
    }
    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.emplace_back("config_watcher.poll_interval_seconds must be > 0");
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace llmproxy
