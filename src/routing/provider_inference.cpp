#include "routing/provider_inference.hpp"
#include "core/utils.hpp"

namespace llmproxy {

std::string infer_provider_from_model(std::string_view model) {
    if (model.empty()) return kUnknownProvider;

    if (const auto slash = model.find('/'); slash != std::string_view::npos) {
        return std::string(model.substr(0, slash));
    }

    const auto lower = utils::to_lower(model);
    const std::string_view sv = lower;

    if (utils::starts_with_any(sv, {"gpt-", "o1-", "text-davinci", "text-curie"})) return "openai";
    if (sv.find("claude") != std::string_view::npos) return "anthropic";
    if (utils::starts_with_any(sv, {"gemini", "palm"})) return "gemini";
    if (sv.starts_with("mistral")) return "mistral";
    if (sv.starts_with("llama")) return "meta";

    return kUnknownProvider;
}

std::string strip_provider_prefix(std::string_view model) {
    const auto slash = model.find('/');
    if (slash == std::string_view::npos) return std::string(model);
    return std::string(model.substr(slash + 1));
}

} // namespace llmproxy
