#pragma once

#include "core/chat_params.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmproxy {

/**
 * @brief Per-request working structure produced by ModelRouteTable::resolve().
 *
 * `params` is the client request merged with the route and global defaults,
 * with `model` rewritten to the provider identifier and the credential
 * resolved. `log_params` is the same parameter set with the credential
 * redacted, used for the ledger.
 */
struct ResolvedRequest {
    std::string alias;
    std::string provider_model;
    std::string provider;               // inferred from provider_model
    ChatParams params;
    nlohmann::json log_params;
    bool stream = false;
    ModelRoute route;                   // copy of the matched route (pricing overrides)
};

/**
 * @brief Alias -> provider call parameters, replaced wholesale on reload.
 *
 * Readers copy the snapshot pointer under a shared lock and work on an
 * immutable table afterwards; replace() builds a complete new snapshot and
 * swaps it in under an exclusive lock. resolve() never mutates the table.
 */
class ModelRouteTable {
public:
    struct Snapshot {
        std::vector<ModelRoute> routes;                     // config order
        std::unordered_map<std::string, size_t> index;      // alias -> routes[i]
        GlobalDefaults defaults;
    };

    explicit ModelRouteTable(std::vector<ModelRoute> routes = {}, GlobalDefaults defaults = {});

    /**
     * @brief Resolve a client request against the current snapshot.
     *
     * Failures:
     * - INVALID_REQUEST when `model` is missing or empty
     * - MODEL_NOT_FOUND for an unknown alias (message lists enabled aliases)
     * - MODEL_DISABLED for a configured but disabled alias
     */
    [[nodiscard]] Result<ResolvedRequest> resolve(const ChatParams& request) const;

    void replace(std::vector<ModelRoute> routes);
    void replace(std::vector<ModelRoute> routes, GlobalDefaults defaults);

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;
    [[nodiscard]] std::vector<ModelRoute> list() const;
    [[nodiscard]] std::optional<ModelRoute> find(const std::string& alias) const;
    [[nodiscard]] std::vector<std::string> enabled_aliases() const;     // sorted
    [[nodiscard]] size_t size() const;

    /**
     * @brief Look up a credential reference.
     *
     * "os.environ/VAR" reads VAR from the process environment at call time;
     * returns nullopt when the reference is empty or the variable is unset.
     */
    [[nodiscard]] static std::optional<std::string> resolve_secret(const std::string& ref);

    /// Route keys never merged into call parameters
    [[nodiscard]] static bool is_reserved_key(std::string_view key);

private:
    [[nodiscard]] static std::shared_ptr<const Snapshot> build_snapshot(
        std::vector<ModelRoute> routes, GlobalDefaults defaults);

    std::shared_ptr<const Snapshot> snapshot_;
    mutable std::shared_mutex mutex_;
};

} // namespace llmproxy
