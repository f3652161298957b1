#pragma once

#include "core/chat_params.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace llmproxy {

/// A completed (non-streaming) provider answer
struct ProviderResponse {
    nlohmann::json body;            // OpenAI chat.completion object, returned to the client as-is
    std::string provider_hint;      // provider reported by the upstream, else the routed tag (may be empty)
};

/**
 * @brief Interface to an upstream chat-completion provider.
 *
 * Implementations honor the resolved `timeout` and `num_retries` in the
 * params and report failures by throwing a ProviderError subclass.
 */
class IProviderClient {
public:
    using ChunkCallback = std::function<void(const nlohmann::json& chunk)>;

    virtual ~IProviderClient() = default;

    /// @throws ProviderError on any upstream or transport failure
    [[nodiscard]] virtual ProviderResponse complete(const ChatParams& params) = 0;

    /**
     * @brief Stream a completion, invoking `on_chunk` for every
     * chat.completion.chunk object in arrival order.
     *
     * Returns once the provider signals the end of the stream.
     * @throws ProviderError on failure, possibly after some chunks were delivered
     */
    virtual void stream(const ChatParams& params, const ChunkCallback& on_chunk) = 0;
};

} // namespace llmproxy
