#include "provider/provider_error.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace llmproxy {

std::string provider_display_name(std::string_view provider) {
    const auto lower = utils::to_lower(provider);
    if (lower == "openai") return "OpenAI";
    if (lower == "azure") return "Azure";
    if (lower == "anthropic") return "Anthropic";
    if (lower == "gemini") return "Gemini";
    if (lower == "openrouter") return "OpenRouter";
    if (lower.empty() || lower == "unknown") return "Unknown";

    std::string out = lower;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

ProviderError::ProviderError(const char* kind, std::string provider, std::string message,
                             int status_code)
    : std::runtime_error(std::format("llmproxy.{}: {}Exception - {}",
                                     kind, provider_display_name(provider), message)),
      kind_(kind),
      provider_(std::move(provider)),
      message_(std::move(message)),
      status_code_(status_code) {}

void throw_for_status(int status, std::string provider, std::string body) {
    switch (status) {
        case 400: {
            const auto lower = utils::to_lower(body);
            if (lower.find("context_length_exceeded") != std::string::npos
                || lower.find("context window") != std::string::npos
                || lower.find("maximum context length") != std::string::npos) {
                throw ContextWindowExceededError(std::move(provider), std::move(body));
            }
            throw BadRequestError(std::move(provider), std::move(body));
        }
        case 401: throw AuthenticationError(std::move(provider), std::move(body));
        case 403: throw PermissionDeniedError(std::move(provider), std::move(body));
        case 404: throw NotFoundError(std::move(provider), std::move(body));
        case 408: throw TimeoutError(std::move(provider), std::move(body));
        case 422: throw MalformedRequestError(std::move(provider), std::move(body));
        case 429: throw RateLimitError(std::move(provider), std::move(body));
        case 503: throw ServiceUnavailableError(std::move(provider), std::move(body));
        case 504: throw TimeoutError(std::move(provider), std::move(body));
        default: break;
    }
    if (status >= 500) {
        throw InternalServerError(std::move(provider), std::move(body), status);
    }
    throw BadRequestError(std::move(provider), std::move(body));
}

} // namespace llmproxy
