#include <catch2/catch_test_macros.hpp>
#include "core/stream_accumulator.hpp"

using namespace llmproxy;
using nlohmann::json;

namespace {

json delta_chunk(const char* content, json finish = nullptr) {
    return {
        {"id", "chatcmpl-1"},
        {"object", "chat.completion.chunk"},
        {"choices", json::array({{{"index", 0}, {"delta", {{"content", content}}}, {"finish_reason", finish}}})},
    };
}

} // anonymous namespace

TEST_CASE("StreamAccumulator: folds deltas into one completion", "[stream]") {
    StreamAccumulator acc("gpt-4.1");
    acc.add(delta_chunk("Hel"));
    acc.add(delta_chunk("lo"));
    acc.add(delta_chunk("!", "stop"));
    acc.add({{"choices", json::array()},
             {"usage", {{"prompt_tokens", 12}, {"completion_tokens", 3}, {"total_tokens", 15}}}});

    const auto& r = acc.response();
    CHECK(r["id"] == "chatcmpl-1");
    CHECK(r["model"] == "gpt-4.1");
    CHECK(r["choices"][0]["message"]["content"] == "Hello!");
    CHECK(r["choices"][0]["message"]["role"] == "assistant");
    CHECK(r["choices"][0]["finish_reason"] == "stop");
    CHECK(acc.chunk_count() == 4);
    CHECK(acc.prompt_tokens() == 12);
    CHECK(acc.completion_tokens() == 3);
    CHECK(acc.total_tokens() == 15);
    CHECK_FALSE(acc.has_error());
}

TEST_CASE("StreamAccumulator: null finish reason never overwrites", "[stream]") {
    StreamAccumulator acc("m");
    acc.add(delta_chunk("a", "length"));
    acc.add(delta_chunk("b"));
    CHECK(acc.response()["choices"][0]["finish_reason"] == "length");
}

TEST_CASE("StreamAccumulator: tolerates odd chunks", "[stream]") {
    StreamAccumulator acc("m");
    acc.add(json::array());
    acc.add({{"choices", "not-an-array"}});
    acc.add({{"id", ""}, {"choices", json::array({{{"delta", {{"role", "assistant"}}}}})}});

    CHECK(acc.chunk_count() == 3);
    CHECK(acc.response()["id"].is_null());
    CHECK(acc.response()["choices"][0]["message"]["content"] == "");
    CHECK(acc.total_tokens() == 0);
}

TEST_CASE("StreamAccumulator: total falls back to prompt plus completion", "[stream]") {
    StreamAccumulator acc("m");
    acc.add({{"usage", {{"prompt_tokens", 4}, {"completion_tokens", 6}}}});
    CHECK(acc.total_tokens() == 10);
}

TEST_CASE("StreamAccumulator: error slot", "[stream]") {
    StreamAccumulator acc("m");
    acc.add(delta_chunk("partial"));
    acc.set_error({{"message", "Rate limited"}, {"type", "rate_limit_error"}, {"code", "rate_limit_exceeded"}});
    CHECK(acc.has_error());
    CHECK(acc.response()["error"]["type"] == "rate_limit_error");
    CHECK(acc.response()["choices"][0]["message"]["content"] == "partial");
}

TEST_CASE("usage_tokens: missing or malformed usage is zero", "[stream]") {
    CHECK(usage_tokens(json::object(), "prompt_tokens") == 0);
    CHECK(usage_tokens({{"usage", "n/a"}}, "prompt_tokens") == 0);
    CHECK(usage_tokens({{"usage", {{"prompt_tokens", "7"}}}}, "prompt_tokens") == 0);
    CHECK(usage_tokens({{"usage", {{"prompt_tokens", 7}}}}, "prompt_tokens") == 7);
}
