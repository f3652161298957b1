#include "provider/openai_compatible_client.hpp"
#include "provider/provider_error.hpp"
#include "provider/sse_parser.hpp"
#include "routing/provider_inference.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <thread>

namespace llmproxy {

namespace {

constexpr const char* kChatCompletionsPath = "/chat/completions";
constexpr size_t kErrorPreviewBytes = 2000;

bool is_retryable_status(int status) {
    return status == httplib::StatusCode::TooManyRequests_429 || status >= 500;
}

// Error events inside a 200 stream carry their status in error.code when numeric
int stream_error_status(const nlohmann::json& error) {
    if (error.is_object()) {
        const auto it = error.find("code");
        if (it != error.end() && it->is_number_integer()) {
            const auto code = it->get<int>();
            if (code >= 400 && code < 600) return code;
        }
    }
    return 500;
}

// Gateways such as OpenRouter name the provider that actually served the call
std::string provider_from_response(const nlohmann::json& body, const std::string& routed) {
    if (const auto it = body.find("provider"); it != body.end() && it->is_string()) {
        auto reported = utils::to_lower(it->get<std::string>());
        if (!reported.empty()) return reported;
    }
    return routed;
}

std::chrono::milliseconds to_millis(double seconds) {
    // NaN and negatives collapse to zero
    seconds = seconds > 0.0 ? std::min(seconds, kMaxTimeoutSeconds) : 0.0;
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

[[noreturn]] void throw_transport_error(const std::string& provider, httplib::Error err) {
    if (err == httplib::Error::ConnectionTimeout) {
        throw TimeoutError(provider, "Connection timed out");
    }
    if (err == httplib::Error::Read) {
        throw TimeoutError(provider, "Request timed out while reading the provider response");
    }
    throw APIConnectionError(provider, std::format("HTTP request failed: {}", httplib::to_string(err)));
}

httplib::Headers build_headers(const ChatParams& params, bool streaming) {
    httplib::Headers headers = {
        {"Accept", streaming ? "text/event-stream" : "application/json"},
    };
    if (params.api_key && !params.api_key->empty()) {
        headers.emplace("Authorization", "Bearer " + *params.api_key);
    }
    return headers;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

OpenAICompatibleClient::OpenAICompatibleClient()
    : OpenAICompatibleClient(Config{}) {}

OpenAICompatibleClient::OpenAICompatibleClient(Config config)
    : config_(std::move(config)) {}

const std::unordered_map<std::string, std::string>& OpenAICompatibleClient::default_api_bases() {
    static const std::unordered_map<std::string, std::string> kBases = {
        {"openai",     "https://api.openai.com/v1"},
        {"anthropic",  "https://api.anthropic.com/v1"},
        {"gemini",     "https://generativelanguage.googleapis.com/v1beta/openai"},
        {"openrouter", "https://openrouter.ai/api/v1"},
        {"mistral",    "https://api.mistral.ai/v1"},
        {"groq",       "https://api.groq.com/openai/v1"},
        {"deepseek",   "https://api.deepseek.com/v1"},
        {"ollama",     "http://localhost:11434/v1"},
    };
    return kBases;
}

std::string OpenAICompatibleClient::api_base_for(const std::string& provider) const {
    if (const auto it = config_.api_bases.find(provider); it != config_.api_bases.end()) {
        return it->second;
    }
    const auto& defaults = default_api_bases();
    if (const auto it = defaults.find(provider); it != defaults.end()) {
        return it->second;
    }
    if (const auto it = config_.api_bases.find(kFallbackBaseKey); it != config_.api_bases.end()) {
        return it->second;
    }
    throw BadRequestError(provider, std::format(
        "LLM Provider NOT provided or not supported: no api_base configured for '{}'", provider));
}

OpenAICompatibleClient::Endpoint OpenAICompatibleClient::endpoint_for(const ChatParams& params) const {
    Endpoint ep;
    ep.provider = infer_provider_from_model(params.model.value_or(""));
    const std::string base = api_base_for(ep.provider);

    // Split "scheme://host[:port]/prefix" into the client origin and path prefix
    const auto scheme_end = base.find("://");
    const auto path_start = base.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        ep.host = base;
        ep.path = kChatCompletionsPath;
    } else {
        ep.host = base.substr(0, path_start);
        std::string prefix = base.substr(path_start);
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
        ep.path = prefix + kChatCompletionsPath;
    }
    return ep;
}

double OpenAICompatibleClient::timeout_for(const ChatParams& params) const {
    return params.timeout.value_or(config_.default_timeout_seconds);
}

int64_t OpenAICompatibleClient::retries_for(const ChatParams& params) const {
    return std::clamp<int64_t>(params.num_retries.value_or(config_.default_num_retries), 0, kMaxNumRetries);
}

void OpenAICompatibleClient::backoff(int64_t attempt) {
    retries_.fetch_add(1, std::memory_order_relaxed);
    std::this_thread::sleep_for(std::chrono::milliseconds(
        static_cast<int64_t>(config_.retry_backoff_ms) * (attempt + 1)));
}

// ============================================================================
// Request Body
// ============================================================================

nlohmann::json OpenAICompatibleClient::build_request_body(const ChatParams& params, bool streaming) {
    auto body = params.to_json();

    // Proxy-side controls, never sent upstream
    body.erase("api_key");
    body.erase("timeout");
    body.erase("num_retries");

    if (params.model) body["model"] = strip_provider_prefix(*params.model);

    if (streaming) {
        body["stream"] = true;
        if (!body.contains("stream_options")) {
            body["stream_options"] = {{"include_usage", true}};
        }
    } else {
        body.erase("stream");
        body.erase("stream_options");
    }
    return body;
}

// ============================================================================
// Non-streaming
// ============================================================================

ProviderResponse OpenAICompatibleClient::complete(const ChatParams& params) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    const auto ep = endpoint_for(params);
    const auto timeout = to_millis(timeout_for(params));
    const auto max_retries = retries_for(params);
    const auto body = build_request_body(params, false).dump();
    const auto headers = build_headers(params, false);

    httplib::Client cli(ep.host);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    for (int64_t attempt = 0;; ++attempt) {
        const auto res = cli.Post(ep.path, headers, body, "application/json");

        if (!res) {
            if (attempt < max_retries) {
                backoff(attempt);
                continue;
            }
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw_transport_error(ep.provider, res.error());
        }

        if (res->status != httplib::StatusCode::OK_200) {
            if (is_retryable_status(res->status) && attempt < max_retries) {
                utils::log::debug(std::format("{} returned HTTP {}, retrying ({}/{})",
                    ep.provider, res->status, attempt + 1, max_retries));
                backoff(attempt);
                continue;
            }
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw_for_status(res->status, ep.provider, res->body.substr(0, kErrorPreviewBytes));
        }

        auto parsed = nlohmann::json::parse(res->body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw ProviderError(ep.provider, std::format("Invalid JSON in provider response: {}",
                res->body.substr(0, 200)), res->status);
        }
        auto hint = provider_from_response(parsed, ep.provider);
        return ProviderResponse{std::move(parsed), std::move(hint)};
    }
}

// ============================================================================
// Streaming
// ============================================================================

void OpenAICompatibleClient::stream(const ChatParams& params, const ChunkCallback& on_chunk) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    stream_requests_.fetch_add(1, std::memory_order_relaxed);

    const auto ep = endpoint_for(params);
    const auto timeout = to_millis(timeout_for(params));
    const auto max_retries = retries_for(params);
    const auto body = build_request_body(params, true).dump();

    httplib::Client cli(ep.host);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    for (int64_t attempt = 0;; ++attempt) {
        int status = 0;
        std::string error_body;
        std::exception_ptr callback_error;

        SseParser parser([&](std::string_view data) {
            auto chunk = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
            if (chunk.is_discarded()) {
                utils::log::warn(std::format("{}: skipping undecodable stream event", ep.provider));
                return;
            }
            if (chunk.is_object() && chunk.contains("error")) {
                throw_for_status(stream_error_status(chunk["error"]), ep.provider,
                                 std::string(data.substr(0, kErrorPreviewBytes)));
            }
            on_chunk(chunk);
        });

        httplib::Request req;
        req.method = "POST";
        req.path = ep.path;
        req.headers = build_headers(params, true);
        req.body = body;
        req.set_header("Content-Type", "application/json");
        req.response_handler = [&](const httplib::Response& r) {
            status = r.status;
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (status != httplib::StatusCode::OK_200) {
                if (error_body.size() < kErrorPreviewBytes) error_body.append(data, len);
                return true;
            }
            // Exceptions must not unwind through the HTTP library
            try {
                parser.feed(std::string_view(data, len));
                return true;
            } catch (const std::exception&) {
                callback_error = std::current_exception();
                return false;
            }
        };

        httplib::Response res;
        httplib::Error err = httplib::Error::Success;
        const bool sent = cli.send(req, res, err);

        if (callback_error) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            std::rethrow_exception(callback_error);
        }

        if (!sent && status == 0) {
            if (attempt < max_retries) {
                backoff(attempt);
                continue;
            }
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw_transport_error(ep.provider, err);
        }

        if (status != httplib::StatusCode::OK_200) {
            // Nothing was delivered yet, so a retry is invisible to the caller
            if (is_retryable_status(status) && attempt < max_retries) {
                backoff(attempt);
                continue;
            }
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw_for_status(status, ep.provider, error_body.empty() ? res.body : error_body);
        }

        if (!sent) {
            // Connection dropped mid-stream; never retried once chunks flowed
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw_transport_error(ep.provider, err);
        }

        parser.finish();
        return;
    }
}

// ============================================================================
// Stats
// ============================================================================

OpenAICompatibleClient::Stats OpenAICompatibleClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        stream_requests_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed)
    };
}

} // namespace llmproxy
