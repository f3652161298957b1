#include <catch2/catch_test_macros.hpp>
#include "provider/error_classifier.hpp"
#include "provider/provider_error.hpp"

#include <stdexcept>

using namespace llmproxy;

namespace {

void check_outcome(const std::exception& e, int status, const char* type, const char* code) {
    const auto c = default_error_classifier().classify(e);
    CHECK(c.status == status);
    CHECK(c.type == type);
    CHECK(c.code == code);
}

} // anonymous namespace

TEST_CASE("ErrorClassifier: default table", "[errors]") {
    check_outcome(MalformedRequestError("openai", "x"), 400, "invalid_request_error", "malformed_request");
    check_outcome(ContextWindowExceededError("openai", "x"), 400, "invalid_request_error", "context_length_exceeded");
    check_outcome(BadRequestError("openai", "x"), 400, "invalid_request_error", "bad_request");
    check_outcome(RateLimitError("openai", "x"), 429, "rate_limit_error", "rate_limit_exceeded");
    check_outcome(AuthenticationError("openai", "x"), 401, "authentication_error", "invalid_api_key");
    check_outcome(PermissionDeniedError("openai", "x"), 403, "permission_denied", "permission_denied");
    check_outcome(NotFoundError("openai", "x"), 404, "invalid_request_error", "model_not_found");
    check_outcome(TimeoutError("openai", "x"), 504, "timeout_error", "request_timeout");
    check_outcome(InternalServerError("openai", "x"), 503, "service_unavailable", "service_unavailable");
    check_outcome(ServiceUnavailableError("openai", "x"), 503, "service_unavailable", "service_unavailable");
    check_outcome(APIConnectionError("openai", "x"), 502, "connection_error", "connection_error");
}

TEST_CASE("ErrorClassifier: unknown exceptions fall back to 500", "[errors]") {
    check_outcome(std::runtime_error("boom"), 500, "api_error", "internal_error");
    check_outcome(ProviderError("openai", "generic"), 500, "api_error", "internal_error");
}

TEST_CASE("ErrorClassifier: first registered match wins", "[errors]") {
    SECTION("generic rule first shadows the specialization") {
        ErrorClassifier c;
        c.add_rule<APIConnectionError>("APIConnectionError", {502, "connection_error", "connection_error"});
        c.add_rule<TimeoutError>("TimeoutError", {504, "timeout_error", "request_timeout"});
        CHECK(c.classify(TimeoutError("openai", "slow")).status == 502);
    }

    SECTION("specialization first is reachable") {
        ErrorClassifier c;
        c.add_rule<TimeoutError>("TimeoutError", {504, "timeout_error", "request_timeout"});
        c.add_rule<APIConnectionError>("APIConnectionError", {502, "connection_error", "connection_error"});
        CHECK(c.classify(TimeoutError("openai", "slow")).status == 504);
        CHECK(c.classify(APIConnectionError("openai", "refused")).status == 502);
    }

    SECTION("custom predicates") {
        ErrorClassifier c;
        c.add_rule("teapot",
            [](const std::exception& e) { return std::string_view(e.what()).find("teapot") != std::string_view::npos; },
            {418, "teapot_error", "short_and_stout"});
        CHECK(c.classify(std::runtime_error("I am a teapot")).status == 418);
        CHECK(c.classify(std::runtime_error("coffee")).status == 500);
        CHECK(c.rules().size() == 1);
    }
}

TEST_CASE("error_name: kind reported for ledger text", "[errors]") {
    CHECK(error_name(RateLimitError("openai", "x")) == "RateLimitError");
    CHECK(error_name(TimeoutError("openai", "x")) == "TimeoutError");
    CHECK(error_name(MalformedRequestError("openai", "x")) == "MalformedRequestError");
    CHECK(error_name(InternalServerError("openai", "x")) == "ProviderError");
    CHECK(error_name(ServiceUnavailableError("openai", "x")) == "ProviderError");
    CHECK(error_name(std::logic_error("x")) == "UnexpectedError");
}

TEST_CASE("extract_error_message: preference order", "[errors]") {
    SECTION("JSON inside a byte-string fragment") {
        const std::string text =
            R"(litellm.BadRequestError: AnthropicException - b'{"type":"error","error":{"type":"invalid_request_error","message":"max_tokens: too large"}}')";
        CHECK(extract_error_message(text) == "max_tokens: too large");
    }

    SECTION("whole string is JSON") {
        CHECK(extract_error_message(R"({"error":{"message":"Rate limit reached"}})") == "Rate limit reached");
        CHECK(extract_error_message(R"({"message":"plain message"})") == "plain message");
    }

    SECTION("library prefix is stripped") {
        CHECK(extract_error_message("litellm.RateLimitError: OpenAIException - Too many requests")
              == "Too many requests");
    }

    SECTION("prefix followed by a JSON error body") {
        CHECK(extract_error_message(
                  R"(llmproxy.AuthenticationError: OpenAIException - {"error":{"message":"Incorrect API key"}})")
              == "Incorrect API key");
    }

    SECTION("anything else is returned untouched") {
        CHECK(extract_error_message("connection reset by peer") == "connection reset by peer");
        CHECK(extract_error_message("") == "");
    }
}

TEST_CASE("ProviderError: verbose what() round-trips through extraction", "[errors]") {
    const RateLimitError e("openai", R"({"error":{"message":"Slow down","type":"requests"}})");
    CHECK(e.status_code() == 429);
    CHECK(std::string(e.kind()) == "RateLimitError");
    CHECK(extract_error_message(e.what()) == "Slow down");
}

TEST_CASE("throw_for_status: status to kind mapping", "[errors]") {
    CHECK_THROWS_AS(throw_for_status(401, "openai", "bad key"), AuthenticationError);
    CHECK_THROWS_AS(throw_for_status(403, "openai", "nope"), PermissionDeniedError);
    CHECK_THROWS_AS(throw_for_status(404, "openai", "missing"), NotFoundError);
    CHECK_THROWS_AS(throw_for_status(429, "openai", "slow"), RateLimitError);
    CHECK_THROWS_AS(throw_for_status(503, "openai", "down"), ServiceUnavailableError);
    CHECK_THROWS_AS(throw_for_status(502, "openai", "gateway"), InternalServerError);
    CHECK_THROWS_AS(throw_for_status(418, "openai", "odd"), BadRequestError);
    CHECK_THROWS_AS(throw_for_status(400, "openai",
        "This model's maximum context length is 8192 tokens"), ContextWindowExceededError);
}

TEST_CASE("build_error_body: OpenAI-style envelope", "[errors]") {
    const auto body = build_error_body("Model 'x' is disabled", {403, "permission_denied", "model_disabled"});
    CHECK(body["error"]["message"] == "Model 'x' is disabled");
    CHECK(body["error"]["type"] == "permission_denied");
    CHECK(body["error"]["code"] == "model_disabled");
}
