#include "core/stream_accumulator.hpp"

namespace llmproxy {

int64_t usage_tokens(const nlohmann::json& response, const char* key) {
    if (!response.is_object()) return 0;
    const auto usage = response.find("usage");
    if (usage == response.end() || !usage->is_object()) return 0;
    const auto it = usage->find(key);
    if (it == usage->end() || !it->is_number()) return 0;
    return it->get<int64_t>();
}

StreamAccumulator::StreamAccumulator(std::string model) {
    response_ = {
        {"id", nullptr},
        {"model", std::move(model)},
        {"choices", nlohmann::json::array({
            {
                {"message", {{"role", "assistant"}, {"content", ""}}},
                {"finish_reason", nullptr},
            },
        })},
        {"usage", {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}}},
    };
}

void StreamAccumulator::add(const nlohmann::json& chunk) {
    ++chunks_;
    if (!chunk.is_object()) return;

    auto& choice = response_["choices"][0];

    const auto choices = chunk.find("choices");
    if (choices != chunk.end() && choices->is_array() && !choices->empty()) {
        const auto& first = (*choices)[0];
        if (first.is_object()) {
            const auto delta = first.find("delta");
            if (delta != first.end() && delta->is_object()) {
                const auto content = delta->find("content");
                if (content != delta->end() && content->is_string()) {
                    choice["message"]["content"] =
                        choice["message"]["content"].get<std::string>() + content->get<std::string>();
                }
            }
            const auto finish = first.find("finish_reason");
            if (finish != first.end() && !finish->is_null()) {
                choice["finish_reason"] = *finish;
            }
        }
    }

    const auto id = chunk.find("id");
    if (id != chunk.end() && id->is_string() && !id->get_ref<const std::string&>().empty()) {
        response_["id"] = *id;
    }

    const auto usage = chunk.find("usage");
    if (usage != chunk.end() && usage->is_object()) {
        response_["usage"] = *usage;
    }
}

void StreamAccumulator::set_error(nlohmann::json error) {
    response_["error"] = std::move(error);
}

int64_t StreamAccumulator::prompt_tokens() const {
    return usage_tokens(response_, "prompt_tokens");
}

int64_t StreamAccumulator::completion_tokens() const {
    return usage_tokens(response_, "completion_tokens");
}

int64_t StreamAccumulator::total_tokens() const {
    const auto total = usage_tokens(response_, "total_tokens");
    return total > 0 ? total : prompt_tokens() + completion_tokens();
}

} // namespace llmproxy
