#include "provider/error_classifier.hpp"
#include "provider/provider_error.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <optional>
#include <regex>

namespace llmproxy {

// ============================================================================
// ErrorClassifier
// ============================================================================

ErrorClassifier& ErrorClassifier::add_rule(std::string name, Predicate predicate,
                                           ErrorClassification outcome) {
    rules_.push_back(Rule{std::move(name), std::move(predicate), std::move(outcome)});
    return *this;
}

ErrorClassification ErrorClassifier::classify(const std::exception& e) const {
    for (const auto& rule : rules_) {
        if (rule.matches(e)) return rule.outcome;
    }
    return ErrorClassification{};
}

ErrorClassifier ErrorClassifier::with_default_rules() {
    ErrorClassifier c;
    // Specializations first: both derive from BadRequestError
    c.add_rule<MalformedRequestError>("MalformedRequestError",
        {400, "invalid_request_error", "malformed_request"});
    c.add_rule<ContextWindowExceededError>("ContextWindowExceededError",
        {400, "invalid_request_error", "context_length_exceeded"});
    c.add_rule<BadRequestError>("BadRequestError",
        {400, "invalid_request_error", "bad_request"});
    c.add_rule<RateLimitError>("RateLimitError",
        {429, "rate_limit_error", "rate_limit_exceeded"});
    c.add_rule<AuthenticationError>("AuthenticationError",
        {401, "authentication_error", "invalid_api_key"});
    c.add_rule<PermissionDeniedError>("PermissionDeniedError",
        {403, "permission_denied", "permission_denied"});
    c.add_rule<NotFoundError>("NotFoundError",
        {404, "invalid_request_error", "model_not_found"});
    // TimeoutError derives from APIConnectionError
    c.add_rule<TimeoutError>("TimeoutError",
        {504, "timeout_error", "request_timeout"});
    c.add_rule<InternalServerError>("InternalServerError",
        {503, "service_unavailable", "service_unavailable"});
    c.add_rule<ServiceUnavailableError>("ServiceUnavailableError",
        {503, "service_unavailable", "service_unavailable"});
    c.add_rule<APIConnectionError>("APIConnectionError",
        {502, "connection_error", "connection_error"});
    return c;
}

const ErrorClassifier& default_error_classifier() {
    static const ErrorClassifier instance = ErrorClassifier::with_default_rules();
    return instance;
}

std::string error_name(const std::exception& e) {
    if (dynamic_cast<const InternalServerError*>(&e) != nullptr
        || dynamic_cast<const ServiceUnavailableError*>(&e) != nullptr) {
        return "ProviderError";
    }
    if (const auto* pe = dynamic_cast<const ProviderError*>(&e)) {
        return pe->kind();
    }
    return "UnexpectedError";
}

// ============================================================================
// Message extraction
// ============================================================================

namespace {

std::optional<std::string> message_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    if (const auto err = j.find("error"); err != j.end()) {
        if (err->is_object()) {
            const auto msg = err->find("message");
            if (msg != err->end() && msg->is_string()) return msg->get<std::string>();
        } else if (err->is_string()) {
            return err->get<std::string>();
        }
    }
    if (const auto msg = j.find("message"); msg != j.end() && msg->is_string()) {
        return msg->get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::string> message_from_json_text(std::string_view text) {
    const auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return std::nullopt;
    return message_from_json(parsed);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// JSON object embedded in a byte-string literal: ... b'{"error": {...}}' ...
std::optional<std::string> message_from_bytes_fragment(std::string_view text) {
    for (size_t pos = text.find('b'); pos != std::string_view::npos; pos = text.find('b', pos + 1)) {
        if (pos + 2 >= text.size()) break;
        const char quote = text[pos + 1];
        if (quote != '\'' && quote != '"') continue;
        if (pos > 0 && is_word_char(text[pos - 1])) continue;
        if (text[pos + 2] != '{') continue;

        const std::string terminator{'}', quote};
        const auto end = text.find(terminator, pos + 2);
        if (end == std::string_view::npos) continue;

        if (auto msg = message_from_json_text(text.substr(pos + 2, end - pos - 1))) {
            return msg;
        }
    }
    return std::nullopt;
}

// "litellm.RateLimitError: OpenAIException - <message>"
std::optional<std::string> strip_exception_prefix(std::string_view text) {
    static const std::regex kPrefix(R"(^[A-Za-z_]\w*\.[A-Za-z_]\w*: [A-Za-z_]\w*Exception - )");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, kPrefix)) return std::nullopt;
    return std::string(text.substr(static_cast<size_t>(match.length(0))));
}

} // anonymous namespace

std::string extract_error_message(std::string_view text) {
    if (auto msg = message_from_bytes_fragment(text)) return *msg;
    if (auto msg = message_from_json_text(text)) return *msg;

    if (auto rest = strip_exception_prefix(text)) {
        // The remainder is frequently the upstream JSON error body
        if (auto msg = message_from_bytes_fragment(*rest)) return *msg;
        if (auto msg = message_from_json_text(*rest)) return *msg;
        return utils::trim(*rest);
    }
    return std::string(text);
}

nlohmann::json build_error_body(std::string_view message,
                                const ErrorClassification& classification) {
    nlohmann::json error = {
        {"message", std::string(message)},
        {"type", classification.type},
    };
    if (!classification.code.empty()) error["code"] = classification.code;
    return {{"error", std::move(error)}};
}

} // namespace llmproxy
