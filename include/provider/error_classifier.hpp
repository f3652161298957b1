#pragma once

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace llmproxy {

/// Client-facing outcome of a failure: HTTP status plus OpenAI-style type/code
struct ErrorClassification {
    int status = 500;
    std::string type = "api_error";
    std::string code = "internal_error";
};

/**
 * @brief Ordered (predicate -> outcome) table over caught exceptions.
 *
 * Rules are evaluated in registration order and the first match wins, so a
 * specialization must be registered before the kind it derives from
 * (TimeoutError before APIConnectionError, MalformedRequestError before
 * BadRequestError). Anything unmatched classifies as 500/api_error.
 */
class ErrorClassifier {
public:
    using Predicate = std::function<bool(const std::exception&)>;

    struct Rule {
        std::string name;
        Predicate matches;
        ErrorClassification outcome;
    };

    ErrorClassifier() = default;

    /// Table covering the full provider hierarchy
    [[nodiscard]] static ErrorClassifier with_default_rules();

    ErrorClassifier& add_rule(std::string name, Predicate predicate, ErrorClassification outcome);

    /// Match by dynamic type (E or anything derived from it)
    template<typename E>
    ErrorClassifier& add_rule(std::string name, ErrorClassification outcome) {
        return add_rule(std::move(name),
            [](const std::exception& e) { return dynamic_cast<const E*>(&e) != nullptr; },
            std::move(outcome));
    }

    [[nodiscard]] ErrorClassification classify(const std::exception& e) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
};

/// Process-wide default table (static, built once)
[[nodiscard]] const ErrorClassifier& default_error_classifier();

/**
 * @brief Kind name used in ledger error text and console logs.
 *
 * Provider kinds report their own name except upstream internal/unavailable
 * failures which read "ProviderError"; non-provider exceptions read
 * "UnexpectedError".
 */
[[nodiscard]] std::string error_name(const std::exception& e);

/**
 * @brief Pull a human-readable message out of a verbose exception string.
 *
 * Tried in order: a JSON object inside a b'...' fragment, the whole string as
 * JSON (`error.message`, then `message`), stripping a
 * "<lib>.<Kind>: <Provider>Exception - " prefix, the raw text.
 */
[[nodiscard]] std::string extract_error_message(std::string_view text);

/// {"error":{"message","type","code"}}
[[nodiscard]] nlohmann::json build_error_body(std::string_view message,
                                              const ErrorClassification& classification);

} // namespace llmproxy
