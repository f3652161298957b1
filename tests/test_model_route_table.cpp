#include <catch2/catch_test_macros.hpp>
#include "routing/model_route_table.hpp"

#include <cstdlib>
#include <thread>
#include <atomic>

using namespace llmproxy;

namespace {

ModelRoute route(std::string alias, std::string provider_model, bool enabled = true) {
    ModelRoute r;
    r.alias = std::move(alias);
    r.provider_model = std::move(provider_model);
    r.enabled = enabled;
    return r;
}

ChatParams request(const nlohmann::json& body) {
    auto parsed = ChatParams::from_json(body);
    REQUIRE(parsed.is_ok());
    return parsed.value();
}

} // anonymous namespace

TEST_CASE("ModelRouteTable: resolve rewrites alias to provider model", "[routing]") {
    ModelRouteTable table({route("gpt-4.1", "openai/gpt-4.1")});

    const auto result = table.resolve(request({{"model", "gpt-4.1"}, {"messages", nlohmann::json::array()}}));
    REQUIRE(result.is_ok());
    const auto& r = result.value();
    CHECK(r.alias == "gpt-4.1");
    CHECK(r.provider_model == "openai/gpt-4.1");
    CHECK(r.provider == "openai");
    CHECK(r.params.model == "openai/gpt-4.1");
    CHECK_FALSE(r.stream);
}

TEST_CASE("ModelRouteTable: resolution failures", "[routing]") {
    ModelRouteTable table({
        route("zeta", "openai/gpt-4o"),
        route("alpha", "anthropic/claude-3-5-haiku-20241022"),
        route("off", "openai/gpt-4", false),
    });

    SECTION("unknown alias lists enabled aliases sorted") {
        const auto result = table.resolve(request({{"model", "nope"}}));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::MODEL_NOT_FOUND);
        CHECK(result.error_message() ==
              "Model 'nope' not found in configuration. Available models: alpha, zeta");
    }

    SECTION("disabled alias") {
        const auto result = table.resolve(request({{"model", "off"}}));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::MODEL_DISABLED);
    }

    SECTION("missing or empty model") {
        CHECK(table.resolve(request(nlohmann::json::object())).error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(table.resolve(request({{"model", ""}})).error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(table.resolve(request({{"model", nullptr}})).error_category() == ErrorCategory::INVALID_REQUEST);
    }
}

TEST_CASE("ModelRouteTable: merge precedence client > route > defaults", "[routing]") {
    auto r = route("claude", "anthropic/claude-sonnet-4-20250514");
    r.temperature = 0.2;
    r.max_tokens = 1024;
    r.timeout = 300.0;
    r.extra_params = {{"top_p", 0.9}, {"seed", 7}, {"input_cost_per_million", 3.0}};
    ModelRouteTable table({r}, GlobalDefaults{.timeout = 60.0, .num_retries = 5});

    SECTION("route fills what the client left out, defaults fill the rest") {
        const auto result = table.resolve(request({{"model", "claude"}}));
        REQUIRE(result.is_ok());
        const auto& p = result.value().params;
        CHECK(p.temperature == 0.2);
        CHECK(p.max_tokens == 1024);
        CHECK(p.timeout == 300.0);
        CHECK(p.num_retries == 5);
        CHECK(p.extra["top_p"] == 0.9);
        CHECK(p.extra["seed"] == 7);
        CHECK_FALSE(p.extra.contains("input_cost_per_million"));
    }

    SECTION("client values win") {
        const auto result = table.resolve(request({
            {"model", "claude"}, {"temperature", 1.0}, {"max_tokens", 10},
            {"top_p", 0.1}, {"num_retries", 0}}));
        REQUIRE(result.is_ok());
        const auto& p = result.value().params;
        CHECK(p.temperature == 1.0);
        CHECK(p.max_tokens == 10);
        CHECK(p.extra["top_p"] == 0.1);
        CHECK(p.num_retries == 0);
    }

    SECTION("client null is treated as absent") {
        const auto result = table.resolve(request({
            {"model", "claude"}, {"temperature", nullptr}, {"top_p", nullptr}}));
        REQUIRE(result.is_ok());
        const auto& p = result.value().params;
        CHECK(p.temperature == 0.2);
        CHECK(p.extra["top_p"] == 0.9);
    }
}

TEST_CASE("ModelRouteTable: resolve never mutates the table", "[routing]") {
    auto r = route("m", "openai/gpt-4o-mini");
    r.temperature = 0.5;
    ModelRouteTable table({r});

    const auto before = table.snapshot();
    const auto result = table.resolve(request({{"model", "m"}, {"temperature", 1.5}, {"user", "abc"}}));
    REQUIRE(result.is_ok());

    const auto after = table.find("m");
    REQUIRE(after.has_value());
    CHECK(after->temperature == 0.5);
    CHECK(after->provider_model == "openai/gpt-4o-mini");
    CHECK(after->extra_params.empty());
    CHECK(table.snapshot() == before);
}

TEST_CASE("ModelRouteTable: credential resolved from the environment per call", "[routing]") {
    auto r = route("secret", "openai/gpt-4o");
    r.api_key_ref = "os.environ/LLMPROXY_TEST_ROUTE_KEY";
    ModelRouteTable table({r});

    ::unsetenv("LLMPROXY_TEST_ROUTE_KEY");
    auto result = table.resolve(request({{"model", "secret"}}));
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().params.api_key.has_value());

    ::setenv("LLMPROXY_TEST_ROUTE_KEY", "sk-live-123", 1);
    result = table.resolve(request({{"model", "secret"}}));
    REQUIRE(result.is_ok());
    CHECK(result.value().params.api_key == "sk-live-123");
    CHECK(result.value().log_params["api_key"] == kRedactedApiKey);

    // Rotation is picked up without a reload
    ::setenv("LLMPROXY_TEST_ROUTE_KEY", "sk-live-456", 1);
    CHECK(table.resolve(request({{"model", "secret"}})).value().params.api_key == "sk-live-456");
    ::unsetenv("LLMPROXY_TEST_ROUTE_KEY");
}

TEST_CASE("ModelRouteTable: replace swaps the whole snapshot", "[routing]") {
    ModelRouteTable table({route("a", "openai/gpt-4o"), route("b", "openai/gpt-4o-mini")});
    const auto old_snapshot = table.snapshot();

    table.replace({route("c", "mistral/mistral-large-latest")});

    CHECK(table.size() == 1);
    CHECK(table.find("a") == std::nullopt);
    CHECK(table.resolve(request({{"model", "c"}})).is_ok());

    // Readers holding the old snapshot keep a complete table
    CHECK(old_snapshot->routes.size() == 2);
    CHECK(old_snapshot->index.contains("a"));
}

TEST_CASE("ModelRouteTable: concurrent resolve during replace", "[routing][concurrency]") {
    ModelRouteTable table({route("m", "openai/gpt-4o")});
    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};

    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) {
            table.replace({route("m", i % 2 ? "openai/gpt-4o" : "anthropic/claude-3-haiku-20240307")});
        }
        stop = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop) {
                const auto result = table.resolve(request({{"model", "m"}}));
                if (!result.is_ok()) {
                    ++failures;
                    continue;
                }
                const auto& r = result.value();
                if (r.provider != "openai" && r.provider != "anthropic") ++failures;
            }
        });
    }

    writer.join();
    for (auto& th : readers) th.join();
    CHECK(failures == 0);
}

TEST_CASE("ModelRouteTable: duplicate aliases keep the later entry", "[routing]") {
    ModelRouteTable table({route("dup", "openai/gpt-4"), route("dup", "openai/gpt-4o")});
    CHECK(table.size() == 1);
    CHECK(table.find("dup")->provider_model == "openai/gpt-4o");
}

TEST_CASE("ModelRouteTable: reserved keys", "[routing]") {
    CHECK(ModelRouteTable::is_reserved_key("model"));
    CHECK(ModelRouteTable::is_reserved_key("api_key"));
    CHECK(ModelRouteTable::is_reserved_key("enabled"));
    CHECK(ModelRouteTable::is_reserved_key("output_cost_per_million"));
    CHECK_FALSE(ModelRouteTable::is_reserved_key("top_p"));
}
