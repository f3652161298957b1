#include "core/chat_params.hpp"
#include "core/types.hpp"

#include <format>

namespace llmproxy {

namespace {

constexpr const char* kModel      = "model";
constexpr const char* kMessages   = "messages";
constexpr const char* kStream     = "stream";
constexpr const char* kTemp       = "temperature";
constexpr const char* kMaxTokens  = "max_tokens";
constexpr const char* kTimeout    = "timeout";
constexpr const char* kNumRetries = "num_retries";
constexpr const char* kApiKey     = "api_key";

bool is_known_field(std::string_view key) {
    return key == kModel || key == kMessages || key == kStream || key == kTemp
        || key == kMaxTokens || key == kTimeout || key == kNumRetries || key == kApiKey;
}

Result<ChatParams> field_error(std::string_view field, std::string_view expected) {
    return Result<ChatParams>::error(ErrorCategory::INVALID_REQUEST,
        std::format("Invalid value for '{}': expected {}", field, expected));
}

} // anonymous namespace

Result<ChatParams> ChatParams::from_json(const nlohmann::json& body) {
    if (!body.is_object()) {
        return Result<ChatParams>::error(ErrorCategory::INVALID_REQUEST,
            "Request body must be a JSON object");
    }

    ChatParams params;
    for (const auto& [key, value] : body.items()) {
        if (value.is_null()) continue;

        if (key == kModel) {
            if (!value.is_string()) return field_error(kModel, "a string");
            params.model = value.get<std::string>();
        } else if (key == kMessages) {
            if (!value.is_array()) return field_error(kMessages, "an array");
            params.messages = value;
        } else if (key == kStream) {
            if (!value.is_boolean()) return field_error(kStream, "a boolean");
            params.stream = value.get<bool>();
        } else if (key == kTemp) {
            if (!value.is_number()) return field_error(kTemp, "a number");
            params.temperature = value.get<double>();
        } else if (key == kMaxTokens) {
            if (!value.is_number_integer()) return field_error(kMaxTokens, "an integer");
            params.max_tokens = value.get<int64_t>();
        } else if (key == kTimeout) {
            if (!value.is_number() || value.get<double>() <= 0.0
                || value.get<double>() > kMaxTimeoutSeconds) {
                return field_error(kTimeout, std::format(
                    "a positive number of seconds up to {}", kMaxTimeoutSeconds));
            }
            params.timeout = value.get<double>();
        } else if (key == kNumRetries) {
            const bool in_range = value.is_number_unsigned()
                ? value.get<uint64_t>() <= static_cast<uint64_t>(kMaxNumRetries)
                : value.is_number_integer() && value.get<int64_t>() >= 0
                    && value.get<int64_t>() <= kMaxNumRetries;
            if (!in_range) {
                return field_error(kNumRetries, std::format(
                    "an integer between 0 and {}", kMaxNumRetries));
            }
            params.num_retries = value.get<int64_t>();
        } else if (key == kApiKey) {
            if (!value.is_string()) return field_error(kApiKey, "a string");
            params.api_key = value.get<std::string>();
        } else {
            params.extra[key] = value;
        }
    }
    return Result<ChatParams>::ok(std::move(params));
}

nlohmann::json ChatParams::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : extra.items()) {
        if (!value.is_null() && !is_known_field(key)) out[key] = value;
    }

    if (model) out[kModel] = *model;
    if (!messages.is_null()) out[kMessages] = messages;
    if (stream) out[kStream] = *stream;
    if (temperature) out[kTemp] = *temperature;
    if (max_tokens) out[kMaxTokens] = *max_tokens;
    if (timeout) out[kTimeout] = *timeout;
    if (num_retries) out[kNumRetries] = *num_retries;
    if (api_key) out[kApiKey] = *api_key;
    return out;
}

nlohmann::json ChatParams::to_log_json() const {
    auto out = to_json();
    if (out.contains(kApiKey)) out[kApiKey] = kRedactedApiKey;
    return out;
}

bool ChatParams::has(std::string_view key) const {
    if (key == kModel) return model.has_value();
    if (key == kMessages) return !messages.is_null();
    if (key == kStream) return stream.has_value();
    if (key == kTemp) return temperature.has_value();
    if (key == kMaxTokens) return max_tokens.has_value();
    if (key == kTimeout) return timeout.has_value();
    if (key == kNumRetries) return num_retries.has_value();
    if (key == kApiKey) return api_key.has_value();

    const auto it = extra.find(std::string(key));
    return it != extra.end() && !it->is_null();
}

} // namespace llmproxy
