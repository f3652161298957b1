#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finops/pricing_catalog.hpp"

#include <stdexcept>

using namespace llmproxy;
using Catch::Matchers::WithinAbs;

namespace {

nlohmann::json completion(const char* model, int prompt, int completion_tokens) {
    return {
        {"model", model},
        {"usage", {{"prompt_tokens", prompt}, {"completion_tokens", completion_tokens},
                   {"total_tokens", prompt + completion_tokens}}},
    };
}

ModelRoute priced_route(std::string provider_model, std::optional<double> in, std::optional<double> out) {
    ModelRoute r;
    r.alias = "alias";
    r.provider_model = std::move(provider_model);
    r.input_cost_per_million = in;
    r.output_cost_per_million = out;
    return r;
}

} // anonymous namespace

TEST_CASE("PricingCatalog: lookup by id with or without provider prefix", "[pricing]") {
    PricingCatalog catalog;
    REQUIRE(catalog.lookup("gpt-4.1").has_value());
    CHECK(catalog.lookup("gpt-4.1")->input_cost_per_million == 2.00);

    const auto prefixed = catalog.lookup("anthropic/claude-sonnet-4-20250514");
    REQUIRE(prefixed.has_value());
    CHECK(prefixed->output_cost_per_million == 15.00);

    CHECK_FALSE(catalog.lookup("ollama/llama3.1").has_value());
    CHECK_FALSE(catalog.lookup("").has_value());

    const auto stats = catalog.get_stats();
    CHECK(stats.lookups == 4);
    CHECK(stats.misses == 2);
}

TEST_CASE("PricingCatalog: completion_cost", "[pricing]") {
    PricingCatalog catalog;

    SECTION("prompt and completion priced separately") {
        // 1000 * 2.00/1M + 500 * 8.00/1M
        CHECK_THAT(catalog.completion_cost(completion("gpt-4.1", 1000, 500)), WithinAbs(0.006, 1e-12));
    }

    SECTION("explicit model overrides the response field") {
        CHECK_THAT(catalog.completion_cost(completion("whatever", 1'000'000, 0), "openai/gpt-4o-mini"),
                   WithinAbs(0.15, 1e-12));
    }

    SECTION("a response without usage costs nothing") {
        CHECK(catalog.completion_cost(nlohmann::json{{"model", "gpt-4o"}}) == 0.0);
    }

    SECTION("unknown model throws") {
        CHECK_THROWS_AS(catalog.completion_cost(completion("mystery-model", 10, 10)), std::invalid_argument);
        CHECK_THROWS_AS(catalog.completion_cost(nlohmann::json::object()), std::invalid_argument);
    }
}

TEST_CASE("PricingCatalog: route overrides", "[pricing]") {
    PricingCatalog catalog;

    SECTION("unpriced model becomes priceable") {
        catalog.apply_route_overrides({priced_route("ollama/llama3.1", 0.0, 0.0)});
        const auto p = catalog.lookup("ollama/llama3.1");
        REQUIRE(p.has_value());
        CHECK(catalog.completion_cost(completion("x", 100, 100), "ollama/llama3.1") == 0.0);
    }

    SECTION("override beats the built-in price") {
        catalog.apply_route_overrides({priced_route("openai/gpt-4.1", 1.0, 2.0)});
        CHECK(catalog.lookup("openai/gpt-4.1")->input_cost_per_million == 1.0);
        // The bare id keeps the built-in price
        CHECK(catalog.lookup("gpt-4.1")->input_cost_per_million == 2.00);
    }

    SECTION("half-specified override keeps the other side") {
        catalog.apply_route_overrides({priced_route("openai/gpt-4o", std::nullopt, 20.0)});
        const auto p = catalog.lookup("openai/gpt-4o");
        REQUIRE(p.has_value());
        CHECK(p->input_cost_per_million == 2.50);
        CHECK(p->output_cost_per_million == 20.0);
    }

    SECTION("reapplying drops overrides of removed routes") {
        catalog.apply_route_overrides({priced_route("custom/model", 1.0, 1.0)});
        REQUIRE(catalog.lookup("custom/model").has_value());
        catalog.apply_route_overrides({});
        CHECK_FALSE(catalog.lookup("custom/model").has_value());
        CHECK(catalog.size() == PricingCatalog::builtin_prices().size());
    }

    SECTION("routes without pricing change nothing") {
        catalog.apply_route_overrides({priced_route("openai/gpt-4.1", std::nullopt, std::nullopt)});
        CHECK(catalog.size() == PricingCatalog::builtin_prices().size());
    }
}
