#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmproxy {

/// USD per one million tokens
struct ModelPricing {
    double input_cost_per_million = 0.0;
    double output_cost_per_million = 0.0;
};

/**
 * @brief Per-model token prices used to cost completed requests.
 *
 * Seeded with a built-in table of well-known provider models; route entries
 * carrying explicit pricing override the built-in price for their provider
 * model. Lookups try the exact id first, then the id without its provider
 * prefix ("openai/gpt-4.1" -> "gpt-4.1").
 */
class PricingCatalog {
public:
    PricingCatalog();
    explicit PricingCatalog(std::unordered_map<std::string, ModelPricing> prices);

    [[nodiscard]] static const std::unordered_map<std::string, ModelPricing>& builtin_prices();

    [[nodiscard]] std::optional<ModelPricing> lookup(std::string_view model) const;

    void set_price(const std::string& model, ModelPricing pricing);

    /// Reset overrides to the base table, then apply every route's pricing
    void apply_route_overrides(const std::vector<ModelRoute>& routes);

    /**
     * @brief Cost of a completed response from its usage block.
     *
     * The model is `model` when given, else the response's "model" field.
     * A response without usage costs 0.
     * @throws std::invalid_argument if no price is known for the model
     */
    [[nodiscard]] double completion_cost(const nlohmann::json& response,
                                         std::string_view model = {}) const;

    [[nodiscard]] size_t size() const;

    struct Stats {
        uint64_t lookups = 0;
        uint64_t misses = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::optional<ModelPricing> find_locked(std::string_view model) const;

    std::unordered_map<std::string, ModelPricing> base_;
    std::unordered_map<std::string, ModelPricing> prices_;
    mutable std::shared_mutex mutex_;

    mutable std::atomic<uint64_t> lookups_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

} // namespace llmproxy
