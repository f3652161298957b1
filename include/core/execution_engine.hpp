#pragma once

#include "core/utils.hpp"
#include "finops/pricing_catalog.hpp"
#include "ledger/usage_ledger.hpp"
#include "provider/error_classifier.hpp"
#include "provider/iprovider_client.hpp"
#include "routing/model_route_table.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llmproxy {

/// HTTP-agnostic outcome of a non-streaming request (or a rejected one)
struct EngineResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Client side of a streaming response.
 *
 * try_send() is best-effort: it reports a failed write with false and never
 * throws, so a vanished client can never fail the request.
 */
class IStreamSink {
public:
    virtual ~IStreamSink() = default;

    [[nodiscard]] virtual bool is_open() const = 0;

    virtual bool try_send(std::string_view frame) noexcept = 0;
};

/**
 * @brief Request after parsing and alias resolution.
 *
 * Either `resolved` is set and the request is ready to execute, or it was
 * rejected: `rejection` holds the error response and the ledger record for
 * it has already been written.
 */
struct PreparedRequest {
    std::optional<ResolvedRequest> resolved;
    EngineResponse rejection;
    utils::Timer timer;                     // started when the request arrived

    [[nodiscard]] bool ok() const { return resolved.has_value(); }
    [[nodiscard]] bool streaming() const { return resolved && resolved->stream; }
};

struct EngineComponents {
    std::shared_ptr<ModelRouteTable> routes;
    std::shared_ptr<IProviderClient> provider;
    std::shared_ptr<UsageLedger> ledger;
    std::shared_ptr<PricingCatalog> pricing;
    const ErrorClassifier* classifier = nullptr;    // null = default_error_classifier()
};

/**
 * @brief Chat-completion request flow: parse -> resolve -> provider call ->
 * response/stream transcoding -> ledger.
 *
 * Every request handed to prepare() produces exactly one ledger record,
 * whichever way it ends: rejected during resolution, completed, failed at
 * the provider, or abandoned by the client mid-stream.
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(EngineComponents components);

    /**
     * @brief Parse and resolve a raw request body.
     *
     * Rejections (invalid JSON, bad parameter types, missing/unknown/disabled
     * model) are ledgered here and returned in `rejection`.
     */
    [[nodiscard]] PreparedRequest prepare(std::string_view body);

    /// Run a prepared non-streaming request (or return its rejection)
    [[nodiscard]] EngineResponse execute(const PreparedRequest& prepared);

    /**
     * @brief Run a prepared streaming request, writing SSE frames to `sink`.
     *
     * Chunks are forwarded as "data: <json>\n\n" while the sink stays open; a
     * provider failure becomes a terminal error frame; "data: [DONE]\n\n"
     * always closes the stream. After a client disconnect the provider stream
     * is still drained so usage keeps accumulating. The ledger write happens
     * once, at scope exit, after the terminal frame is settled.
     */
    void execute_stream(const PreparedRequest& prepared, IStreamSink& sink);

    /// Refuse a request the server will not run (e.g. during shutdown) with a
    /// 503. The model is read from the body when it parses; the refusal is
    /// ledgered like any other rejection.
    [[nodiscard]] EngineResponse reject_unavailable(std::string_view body, const std::string& reason);

    /// prepare() + execute() for callers that never stream
    [[nodiscard]] EngineResponse handle(std::string_view body);

    [[nodiscard]] std::shared_ptr<ModelRouteTable> routes() const { return c_.routes; }
    [[nodiscard]] std::shared_ptr<UsageLedger> ledger() const { return c_.ledger; }
    [[nodiscard]] std::shared_ptr<PricingCatalog> pricing() const { return c_.pricing; }

    struct Stats {
        uint64_t total_requests;
        uint64_t streamed_requests;
        uint64_t rejected_requests;
        uint64_t provider_errors;
        uint64_t client_disconnects;
        uint64_t ledger_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .streamed_requests = streamed_requests_.load(std::memory_order_relaxed),
            .rejected_requests = rejected_requests_.load(std::memory_order_relaxed),
            .provider_errors = provider_errors_.load(std::memory_order_relaxed),
            .client_disconnects = client_disconnects_.load(std::memory_order_relaxed),
            .ledger_failures = ledger_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] EngineResponse reject(const PreparedRequest& prepared,
                                        const std::string& model,
                                        const std::string& provider,
                                        const nlohmann::json& request_data,
                                        std::string_view kind,
                                        const std::string& message,
                                        const ErrorClassification& classification);

    [[nodiscard]] EngineResponse fail(const PreparedRequest& prepared, const std::exception& e);

    /// Cost from the pricing catalog; 0 (logged) when it cannot be computed
    [[nodiscard]] double compute_cost(const nlohmann::json& response, const std::string& model) const;

    void record(const LedgerRecord& record);

    [[nodiscard]] const ErrorClassifier& classifier() const;

    EngineComponents c_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> streamed_requests_{0};
    mutable std::atomic<uint64_t> rejected_requests_{0};
    mutable std::atomic<uint64_t> provider_errors_{0};
    mutable std::atomic<uint64_t> client_disconnects_{0};
    mutable std::atomic<uint64_t> ledger_failures_{0};
};

/// "data: <payload>\n\n"
[[nodiscard]] std::string sse_frame(std::string_view payload);

inline constexpr std::string_view kSseDoneFrame = "data: [DONE]\n\n";

} // namespace llmproxy
