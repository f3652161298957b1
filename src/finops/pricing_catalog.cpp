#include "finops/pricing_catalog.hpp"
#include "routing/provider_inference.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>
#include <stdexcept>

namespace llmproxy {

PricingCatalog::PricingCatalog()
    : PricingCatalog(builtin_prices()) {}

PricingCatalog::PricingCatalog(std::unordered_map<std::string, ModelPricing> prices)
    : base_(std::move(prices)) {
    prices_ = base_;
}

const std::unordered_map<std::string, ModelPricing>& PricingCatalog::builtin_prices() {
    static const std::unordered_map<std::string, ModelPricing> kPrices = {
        // OpenAI
        {"gpt-4.1",                     {2.00, 8.00}},
        {"gpt-4.1-mini",                {0.40, 1.60}},
        {"gpt-4.1-nano",                {0.10, 0.40}},
        {"gpt-4o",                      {2.50, 10.00}},
        {"gpt-4o-mini",                 {0.15, 0.60}},
        {"gpt-4-turbo",                 {10.00, 30.00}},
        {"gpt-4",                       {30.00, 60.00}},
        {"gpt-3.5-turbo",               {0.50, 1.50}},
        {"o1",                          {15.00, 60.00}},
        {"o1-mini",                     {1.10, 4.40}},
        {"o3-mini",                     {1.10, 4.40}},
        // Anthropic
        {"claude-opus-4-20250514",      {15.00, 75.00}},
        {"claude-sonnet-4-20250514",    {3.00, 15.00}},
        {"claude-3-7-sonnet-20250219",  {3.00, 15.00}},
        {"claude-3-5-sonnet-20241022",  {3.00, 15.00}},
        {"claude-3-5-haiku-20241022",   {0.80, 4.00}},
        {"claude-3-opus-20240229",      {15.00, 75.00}},
        {"claude-3-haiku-20240307",     {0.25, 1.25}},
        // Google
        {"gemini-2.0-flash",            {0.10, 0.40}},
        {"gemini-1.5-pro",              {1.25, 5.00}},
        {"gemini-1.5-flash",            {0.075, 0.30}},
        // Mistral
        {"mistral-large-latest",        {2.00, 6.00}},
        {"mistral-small-latest",        {0.20, 0.60}},
    };
    return kPrices;
}

std::optional<ModelPricing> PricingCatalog::find_locked(std::string_view model) const {
    if (model.empty()) return std::nullopt;

    if (const auto it = prices_.find(std::string(model)); it != prices_.end()) {
        return it->second;
    }
    const auto bare = strip_provider_prefix(model);
    if (bare != model) {
        if (const auto it = prices_.find(std::string(bare)); it != prices_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<ModelPricing> PricingCatalog::lookup(std::string_view model) const {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    std::shared_lock lock(mutex_);
    auto found = find_locked(model);
    if (!found) misses_.fetch_add(1, std::memory_order_relaxed);
    return found;
}

void PricingCatalog::set_price(const std::string& model, ModelPricing pricing) {
    std::unique_lock lock(mutex_);
    prices_[model] = pricing;
}

void PricingCatalog::apply_route_overrides(const std::vector<ModelRoute>& routes) {
    auto next = base_;
    size_t overridden = 0;
    for (const auto& route : routes) {
        if (!route.input_cost_per_million && !route.output_cost_per_million) continue;

        // A half-specified override keeps the other side from the base table
        ModelPricing pricing;
        if (const auto it = next.find(route.provider_model); it != next.end()) {
            pricing = it->second;
        } else if (const auto bare = next.find(std::string(strip_provider_prefix(route.provider_model)));
                   bare != next.end()) {
            pricing = bare->second;
        }
        if (route.input_cost_per_million) pricing.input_cost_per_million = *route.input_cost_per_million;
        if (route.output_cost_per_million) pricing.output_cost_per_million = *route.output_cost_per_million;
        next[route.provider_model] = pricing;
        ++overridden;
    }

    std::unique_lock lock(mutex_);
    prices_ = std::move(next);
    if (overridden > 0) {
        utils::log::debug(std::format("Pricing catalog: {} route override(s) applied", overridden));
    }
}

double PricingCatalog::completion_cost(const nlohmann::json& response, std::string_view model) const {
    std::string model_id(model);
    if (model_id.empty() && response.is_object()) {
        const auto it = response.find("model");
        if (it != response.end() && it->is_string()) model_id = it->get<std::string>();
    }

    const auto pricing = lookup(model_id);
    if (!pricing) {
        throw std::invalid_argument(std::format("No pricing known for model '{}'", model_id));
    }

    if (!response.is_object()) return 0.0;
    const auto usage = response.find("usage");
    if (usage == response.end() || !usage->is_object()) return 0.0;

    const auto tokens = [&](const char* key) -> double {
        const auto it = usage->find(key);
        return (it != usage->end() && it->is_number()) ? it->get<double>() : 0.0;
    };

    return tokens("prompt_tokens") * pricing->input_cost_per_million / 1'000'000.0
         + tokens("completion_tokens") * pricing->output_cost_per_million / 1'000'000.0;
}

size_t PricingCatalog::size() const {
    std::shared_lock lock(mutex_);
    return prices_.size();
}

PricingCatalog::Stats PricingCatalog::get_stats() const {
    return {
        lookups_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed)
    };
}

} // namespace llmproxy
