#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace llmproxy {

/**
 * @brief Folds streamed chat.completion.chunk objects into one synthetic
 * chat.completion used for the ledger and cost accounting.
 *
 * Keeps the concatenated delta content, the last non-null finish reason,
 * the last non-empty id and the last usage object. Never sent to clients.
 */
class StreamAccumulator {
public:
    explicit StreamAccumulator(std::string model);

    void add(const nlohmann::json& chunk);

    /// Store a classified failure ({"message","type","code"}) in the error slot
    void set_error(nlohmann::json error);

    [[nodiscard]] const nlohmann::json& response() const { return response_; }

    [[nodiscard]] size_t chunk_count() const { return chunks_; }
    [[nodiscard]] bool has_error() const { return response_.contains("error"); }

    [[nodiscard]] int64_t prompt_tokens() const;
    [[nodiscard]] int64_t completion_tokens() const;
    [[nodiscard]] int64_t total_tokens() const;

private:
    nlohmann::json response_;
    size_t chunks_ = 0;
};

/// Integer token count from a usage object; 0 when absent or malformed
[[nodiscard]] int64_t usage_tokens(const nlohmann::json& response, const char* key);

} // namespace llmproxy
