#pragma once

#include "provider/iprovider_client.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace llmproxy {

/**
 * @brief Provider client for the OpenAI chat-completions wire shape.
 *
 * The provider tag is taken from the model id prefix ("openai/gpt-4.1") and
 * selects the upstream base URL; the prefix is stripped before forwarding.
 * Every provider reachable here exposes the same /chat/completions contract.
 *
 * Features:
 * - Per-call timeout (connect + read) from the resolved params
 * - Retries on transport failures, 429 and 5xx, with linear backoff
 * - Upstream status codes mapped onto the ProviderError hierarchy
 * - Streaming via incremental SSE decoding
 */
class OpenAICompatibleClient : public IProviderClient {
public:
    struct Config {
        // provider tag -> base URL including version path, e.g. "https://api.openai.com/v1"
        std::unordered_map<std::string, std::string> api_bases;
        double default_timeout_seconds = 120.0;
        int64_t default_num_retries = 3;
        uint32_t retry_backoff_ms = 1000;
    };

    OpenAICompatibleClient();
    explicit OpenAICompatibleClient(Config config);

    [[nodiscard]] ProviderResponse complete(const ChatParams& params) override;
    void stream(const ChatParams& params, const ChunkCallback& on_chunk) override;

    /// Built-in base URLs for well-known provider tags
    [[nodiscard]] static const std::unordered_map<std::string, std::string>& default_api_bases();

    /// api_bases key that catches provider tags with no base of their own
    static constexpr const char* kFallbackBaseKey = "default";

    /// Base URL for a provider tag: configured override, then built-in, then
    /// the configured fallback gateway
    /// @throws BadRequestError if the provider has no known base URL
    [[nodiscard]] std::string api_base_for(const std::string& provider) const;

    /// Provider request body: proxy-only fields removed, provider prefix stripped
    [[nodiscard]] static nlohmann::json build_request_body(const ChatParams& params, bool streaming);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t stream_requests = 0;
        uint64_t api_errors = 0;
        uint64_t retries = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct Endpoint {
        std::string provider;
        std::string host;           // scheme://host[:port]
        std::string path;           // e.g. "/v1/chat/completions"
    };

    [[nodiscard]] Endpoint endpoint_for(const ChatParams& params) const;
    [[nodiscard]] double timeout_for(const ChatParams& params) const;
    [[nodiscard]] int64_t retries_for(const ChatParams& params) const;
    void backoff(int64_t attempt);

    Config config_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> stream_requests_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace llmproxy
