#include "routing/model_route_table.hpp"
#include "routing/provider_inference.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>

namespace llmproxy {

namespace {

constexpr std::array<std::string_view, 8> kReservedRouteKeys = {
    "model",
    "model_name",
    "api_key",
    "enabled",
    "input_cost_per_million",
    "output_cost_per_million",
    "input_cost_per_token",
    "output_cost_per_token",
};

std::vector<std::string> sorted_enabled_aliases(const ModelRouteTable::Snapshot& snap) {
    std::vector<std::string> aliases;
    aliases.reserve(snap.routes.size());
    for (const auto& route : snap.routes) {
        if (route.enabled) aliases.push_back(route.alias);
    }
    std::sort(aliases.begin(), aliases.end());
    return aliases;
}

} // anonymous namespace

ModelRouteTable::ModelRouteTable(std::vector<ModelRoute> routes, GlobalDefaults defaults)
    : snapshot_(build_snapshot(std::move(routes), defaults)) {}

std::shared_ptr<const ModelRouteTable::Snapshot> ModelRouteTable::build_snapshot(
    std::vector<ModelRoute> routes, GlobalDefaults defaults) {
    auto snap = std::make_shared<Snapshot>();
    snap->defaults = defaults;
    snap->routes.reserve(routes.size());

    for (auto& route : routes) {
        const auto it = snap->index.find(route.alias);
        if (it != snap->index.end()) {
            utils::log::warn(std::format("Duplicate model alias '{}': later entry wins", route.alias));
            snap->routes[it->second] = std::move(route);
            continue;
        }
        snap->index.emplace(route.alias, snap->routes.size());
        snap->routes.push_back(std::move(route));
    }
    return snap;
}

void ModelRouteTable::replace(std::vector<ModelRoute> routes) {
    const auto defaults = snapshot()->defaults;
    replace(std::move(routes), defaults);
}

void ModelRouteTable::replace(std::vector<ModelRoute> routes, GlobalDefaults defaults) {
    // Build outside the lock; only the pointer swap is exclusive
    auto next = build_snapshot(std::move(routes), defaults);
    std::unique_lock lock(mutex_);
    snapshot_ = std::move(next);
}

std::shared_ptr<const ModelRouteTable::Snapshot> ModelRouteTable::snapshot() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

std::vector<ModelRoute> ModelRouteTable::list() const {
    return snapshot()->routes;
}

std::optional<ModelRoute> ModelRouteTable::find(const std::string& alias) const {
    const auto snap = snapshot();
    const auto it = snap->index.find(alias);
    if (it == snap->index.end()) return std::nullopt;
    return snap->routes[it->second];
}

std::vector<std::string> ModelRouteTable::enabled_aliases() const {
    return sorted_enabled_aliases(*snapshot());
}

size_t ModelRouteTable::size() const {
    return snapshot()->routes.size();
}

bool ModelRouteTable::is_reserved_key(std::string_view key) {
    return std::find(kReservedRouteKeys.begin(), kReservedRouteKeys.end(), key)
        != kReservedRouteKeys.end();
}

std::optional<std::string> ModelRouteTable::resolve_secret(const std::string& ref) {
    if (ref.empty()) return std::nullopt;
    if (!ref.starts_with(kEnvSecretPrefix)) return ref;

    const std::string var = ref.substr(kEnvSecretPrefix.size());
    const char* value = std::getenv(var.c_str());
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

Result<ResolvedRequest> ModelRouteTable::resolve(const ChatParams& request) const {
    if (!request.model || request.model->empty()) {
        return Result<ResolvedRequest>::error(ErrorCategory::INVALID_REQUEST, "Model is required");
    }
    const std::string& alias = *request.model;

    const auto snap = snapshot();
    const auto it = snap->index.find(alias);
    if (it == snap->index.end()) {
        std::string msg = std::format("Model '{}' not found in configuration.", alias);
        const auto available = sorted_enabled_aliases(*snap);
        if (!available.empty()) {
            msg += std::format(" Available models: {}", utils::join(available, ", "));
        }
        return Result<ResolvedRequest>::error(ErrorCategory::MODEL_NOT_FOUND, std::move(msg));
    }

    const ModelRoute& route = snap->routes[it->second];
    if (!route.enabled) {
        return Result<ResolvedRequest>::error(ErrorCategory::MODEL_DISABLED,
            std::format("Model '{}' is disabled", alias));
    }

    ResolvedRequest out;
    out.alias = alias;
    out.provider_model = route.provider_model;
    out.provider = infer_provider_from_model(route.provider_model);
    out.route = route;

    ChatParams& params = out.params;
    params = request;
    params.model = route.provider_model;

    if (auto secret = resolve_secret(route.api_key_ref)) {
        params.api_key = std::move(*secret);
    }

    // Route values fill only what the client left absent or null
    if (!params.temperature) params.temperature = route.temperature;
    if (!params.max_tokens) params.max_tokens = route.max_tokens;
    if (!params.timeout) params.timeout = route.timeout;
    if (!params.num_retries) params.num_retries = route.num_retries;

    for (const auto& [key, value] : route.extra_params.items()) {
        if (is_reserved_key(key) || value.is_null()) continue;
        if (!params.has(key)) params.extra[key] = value;
    }

    // Global defaults last
    if (!params.timeout) params.timeout = snap->defaults.timeout;
    if (!params.num_retries) params.num_retries = snap->defaults.num_retries;

    out.stream = params.is_streaming();
    out.log_params = params.to_log_json();
    return Result<ResolvedRequest>::ok(std::move(out));
}

} // namespace llmproxy
