#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace llmproxy {

/// "openai" -> "OpenAI", "anthropic" -> "Anthropic", other tags capitalized
[[nodiscard]] std::string provider_display_name(std::string_view provider);

/**
 * @brief Base of the tagged provider failure hierarchy.
 *
 * what() carries the verbose provider form
 * "llmproxy.<Kind>: <Provider>Exception - <message>"; message() holds the
 * upstream text alone (often the raw JSON error body).
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string provider, std::string message, int status_code = 0)
        : ProviderError("APIError", std::move(provider), std::move(message), status_code) {}

    [[nodiscard]] const char* kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& provider() const noexcept { return provider_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int status_code() const noexcept { return status_code_; }

protected:
    ProviderError(const char* kind, std::string provider, std::string message, int status_code);

private:
    const char* kind_;
    std::string provider_;
    std::string message_;
    int status_code_;
};

// ---- 4xx -------------------------------------------------------------------

class BadRequestError : public ProviderError {
public:
    BadRequestError(std::string provider, std::string message)
        : ProviderError("BadRequestError", std::move(provider), std::move(message), 400) {}

protected:
    BadRequestError(const char* kind, std::string provider, std::string message)
        : ProviderError(kind, std::move(provider), std::move(message), 400) {}
};

/// Request body the provider could not interpret (bad JSON, wrong field types)
class MalformedRequestError : public BadRequestError {
public:
    MalformedRequestError(std::string provider, std::string message)
        : BadRequestError("MalformedRequestError", std::move(provider), std::move(message)) {}
};

class ContextWindowExceededError : public BadRequestError {
public:
    ContextWindowExceededError(std::string provider, std::string message)
        : BadRequestError("ContextWindowExceededError", std::move(provider), std::move(message)) {}
};

class AuthenticationError : public ProviderError {
public:
    AuthenticationError(std::string provider, std::string message)
        : ProviderError("AuthenticationError", std::move(provider), std::move(message), 401) {}
};

class PermissionDeniedError : public ProviderError {
public:
    PermissionDeniedError(std::string provider, std::string message)
        : ProviderError("PermissionDeniedError", std::move(provider), std::move(message), 403) {}
};

class NotFoundError : public ProviderError {
public:
    NotFoundError(std::string provider, std::string message)
        : ProviderError("NotFoundError", std::move(provider), std::move(message), 404) {}
};

class RateLimitError : public ProviderError {
public:
    RateLimitError(std::string provider, std::string message)
        : ProviderError("RateLimitError", std::move(provider), std::move(message), 429) {}
};

// ---- 5xx / transport -------------------------------------------------------

class InternalServerError : public ProviderError {
public:
    InternalServerError(std::string provider, std::string message, int status_code = 500)
        : ProviderError("InternalServerError", std::move(provider), std::move(message), status_code) {}
};

class ServiceUnavailableError : public ProviderError {
public:
    ServiceUnavailableError(std::string provider, std::string message)
        : ProviderError("ServiceUnavailableError", std::move(provider), std::move(message), 503) {}
};

/// No usable HTTP exchange with the provider (DNS, refused, TLS, reset)
class APIConnectionError : public ProviderError {
public:
    APIConnectionError(std::string provider, std::string message)
        : ProviderError("APIConnectionError", std::move(provider), std::move(message), 0) {}

protected:
    APIConnectionError(const char* kind, std::string provider, std::string message)
        : ProviderError(kind, std::move(provider), std::move(message), 0) {}
};

class TimeoutError : public APIConnectionError {
public:
    TimeoutError(std::string provider, std::string message)
        : APIConnectionError("TimeoutError", std::move(provider), std::move(message)) {}
};

/**
 * @brief Throw the hierarchy member matching an upstream HTTP status.
 *
 * 400 bodies mentioning the context window map to ContextWindowExceededError;
 * unknown 4xx map to BadRequestError, unknown 5xx to InternalServerError.
 */
[[noreturn]] void throw_for_status(int status, std::string provider, std::string body);

} // namespace llmproxy
