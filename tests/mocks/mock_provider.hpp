#pragma once

#include "provider/iprovider_client.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace llmproxy::testing {

/**
 * @brief Scripted provider for engine tests.
 *
 * complete() returns `response` or throws the configured failure; stream()
 * delivers `chunks` in order and, when a failure is set, throws it after
 * `fail_after_chunks` chunks.
 */
class MockProvider : public IProviderClient {
public:
    ProviderResponse response;
    std::vector<nlohmann::json> chunks;

    std::function<void()> failure;            // throws when invoked
    size_t fail_after_chunks = 0;

    [[nodiscard]] ProviderResponse complete(const ChatParams& params) override {
        remember(params);
        complete_calls_.fetch_add(1, std::memory_order_relaxed);
        if (failure) failure();
        return response;
    }

    void stream(const ChatParams& params, const ChunkCallback& on_chunk) override {
        remember(params);
        stream_calls_.fetch_add(1, std::memory_order_relaxed);
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (failure && i == fail_after_chunks) failure();
            on_chunk(chunks[i]);
            delivered_.fetch_add(1, std::memory_order_relaxed);
        }
        if (failure && fail_after_chunks >= chunks.size()) failure();
    }

    template<typename E>
    void fail_with(E error, size_t after_chunks = 0) {
        fail_after_chunks = after_chunks;
        failure = [error] { throw error; };
    }

    [[nodiscard]] std::optional<ChatParams> last_params() const {
        std::lock_guard lock(mutex_);
        return last_params_;
    }

    [[nodiscard]] uint64_t complete_calls() const { return complete_calls_.load(); }
    [[nodiscard]] uint64_t stream_calls() const { return stream_calls_.load(); }
    [[nodiscard]] uint64_t delivered_chunks() const { return delivered_.load(); }

private:
    void remember(const ChatParams& params) {
        std::lock_guard lock(mutex_);
        last_params_ = params;
    }

    mutable std::mutex mutex_;
    std::optional<ChatParams> last_params_;
    std::atomic<uint64_t> complete_calls_{0};
    std::atomic<uint64_t> stream_calls_{0};
    std::atomic<uint64_t> delivered_{0};
};

} // namespace llmproxy::testing
