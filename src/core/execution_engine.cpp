#include "core/execution_engine.hpp"
#include "core/stream_accumulator.hpp"
#include "provider/provider_error.hpp"
#include "routing/provider_inference.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace llmproxy {

namespace {

constexpr const char* kUnknownModel = "unknown";

std::string to_wire(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// Raw client body for the ledger, credential redacted; non-objects are not kept
nlohmann::json redacted_body(const nlohmann::json& doc) {
    if (!doc.is_object()) return nlohmann::json::object();
    auto out = doc;
    if (out.contains("api_key") && !out["api_key"].is_null()) out["api_key"] = kRedactedApiKey;
    return out;
}

std::string model_from_body(const nlohmann::json& doc) {
    if (doc.is_object()) {
        const auto it = doc.find("model");
        if (it != doc.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return kUnknownModel;
}

int64_t duration_ms(const PreparedRequest& prepared) {
    return static_cast<int64_t>(prepared.timer.elapsed_ms().count());
}

/// Runs a callable exactly once when the enclosing scope is left
template<typename Fn>
class DeferredStep {
public:
    explicit DeferredStep(Fn fn) : fn_(std::move(fn)) {}
    ~DeferredStep() { fn_(); }

    DeferredStep(const DeferredStep&) = delete;
    DeferredStep& operator=(const DeferredStep&) = delete;

private:
    Fn fn_;
};

} // anonymous namespace

std::string sse_frame(std::string_view payload) {
    return std::format("data: {}\n\n", payload);
}

// ============================================================================
// Construction
// ============================================================================

ExecutionEngine::ExecutionEngine(EngineComponents components)
    : c_(std::move(components)) {
    if (!c_.routes || !c_.provider || !c_.ledger || !c_.pricing) {
        throw std::invalid_argument("ExecutionEngine requires routes, provider, ledger and pricing");
    }
}

const ErrorClassifier& ExecutionEngine::classifier() const {
    return c_.classifier ? *c_.classifier : default_error_classifier();
}

void ExecutionEngine::record(const LedgerRecord& rec) {
    if (!c_.ledger->append(rec)) {
        ledger_failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

double ExecutionEngine::compute_cost(const nlohmann::json& response, const std::string& model) const {
    try {
        return c_.pricing->completion_cost(response, model);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Cost calculation failed for '{}': {}", model, e.what()));
        return 0.0;
    }
}

// ============================================================================
// Preparation (parse + resolve)
// ============================================================================

PreparedRequest ExecutionEngine::prepare(std::string_view body) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    PreparedRequest out;

    const auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (doc.is_discarded()) {
        out.rejection = reject(out, kUnknownModel, kUnknownProvider, nlohmann::json::object(),
            "InvalidRequestError", "Invalid JSON in request body",
            {400, "invalid_request_error", "invalid_json"});
        return out;
    }

    auto parsed = ChatParams::from_json(doc);
    if (parsed.is_error()) {
        out.rejection = reject(out, model_from_body(doc), kUnknownProvider, redacted_body(doc),
            "InvalidRequestError", parsed.error_message(),
            {400, "invalid_request_error", "invalid_parameter"});
        return out;
    }

    auto resolved = c_.routes->resolve(parsed.value());
    if (resolved.is_error()) {
        const auto& params = parsed.value();
        const auto request_data = params.to_log_json();
        const std::string alias = params.model.value_or(kUnknownModel);

        switch (resolved.error_category()) {
            case ErrorCategory::MODEL_NOT_FOUND:
                out.rejection = reject(out, alias, kUnknownProvider, request_data,
                    "UnknownModel", resolved.error_message(),
                    {404, "invalid_request_error", "model_not_found"});
                break;
            case ErrorCategory::MODEL_DISABLED: {
                const auto route = c_.routes->find(alias);
                const auto provider = route ? infer_provider_from_model(route->provider_model)
                                            : std::string(kUnknownProvider);
                out.rejection = reject(out, alias, provider, request_data,
                    "ModelDisabled", resolved.error_message(),
                    {403, "permission_denied", "model_disabled"});
                break;
            }
            default:
                out.rejection = reject(out, alias.empty() ? kUnknownModel : alias, kUnknownProvider,
                    request_data, "InvalidRequestError", resolved.error_message(),
                    {400, "invalid_request_error", "missing_model"});
                break;
        }
        return out;
    }

    out.resolved = std::move(resolved.value());
    utils::log::info(std::format("LLM Request: {}{}", out.resolved->alias,
                                 out.resolved->stream ? " [streaming]" : ""));
    return out;
}

EngineResponse ExecutionEngine::reject_unavailable(std::string_view body, const std::string& reason) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    PreparedRequest out;

    const auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    const auto model = doc.is_discarded() ? std::string(kUnknownModel) : model_from_body(doc);
    const auto route = c_.routes->find(model);
    const auto provider = route ? infer_provider_from_model(route->provider_model)
                                : std::string(kUnknownProvider);

    return reject(out, model, provider, doc.is_discarded() ? nlohmann::json::object() : redacted_body(doc),
        "ServiceUnavailable", reason,
        {503, "service_unavailable", "service_unavailable"});
}

EngineResponse ExecutionEngine::reject(const PreparedRequest& prepared,
                                       const std::string& model,
                                       const std::string& provider,
                                       const nlohmann::json& request_data,
                                       std::string_view kind,
                                       const std::string& message,
                                       const ErrorClassification& classification) {
    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
    const auto elapsed = duration_ms(prepared);

    LedgerRecord rec;
    rec.model = model;
    rec.provider = provider;
    rec.duration_ms = elapsed;
    rec.request_data = to_wire(request_data);
    rec.error = std::format("{}: {}", kind, message);
    record(rec);

    utils::log::warn(std::format("LLM Response: {} ({}) | {}ms | Error: {}", model, provider, elapsed, kind));
    return EngineResponse{classification.status, build_error_body(message, classification)};
}

EngineResponse ExecutionEngine::fail(const PreparedRequest& prepared, const std::exception& e) {
    provider_errors_.fetch_add(1, std::memory_order_relaxed);
    const auto& req = *prepared.resolved;
    const auto elapsed = duration_ms(prepared);
    const auto classification = classifier().classify(e);
    const auto name = error_name(e);
    const auto message = extract_error_message(e.what());

    LedgerRecord rec;
    rec.model = req.alias;
    rec.provider = req.provider;
    rec.duration_ms = elapsed;
    rec.request_data = to_wire(req.log_params);
    rec.error = std::format("{}: {}", name, message);
    record(rec);

    utils::log::error(std::format("LLM Response: {} ({}) | {}ms | Error: {}", req.alias, req.provider, elapsed, name));
    return EngineResponse{classification.status, build_error_body(message, classification)};
}

// ============================================================================
// Non-streaming
// ============================================================================

EngineResponse ExecutionEngine::execute(const PreparedRequest& prepared) {
    if (!prepared.ok()) return prepared.rejection;
    const auto& req = *prepared.resolved;

    ProviderResponse response;
    try {
        response = c_.provider->complete(req.params);
    } catch (const std::exception& e) {
        return fail(prepared, e);
    }

    std::string provider = req.provider;
    if (provider == kUnknownProvider && !response.provider_hint.empty()) {
        provider = response.provider_hint;
    }

    const auto elapsed = duration_ms(prepared);
    const int64_t prompt = usage_tokens(response.body, "prompt_tokens");
    const int64_t completion = usage_tokens(response.body, "completion_tokens");
    int64_t total = usage_tokens(response.body, "total_tokens");
    if (total == 0) total = prompt + completion;
    const double cost = compute_cost(response.body, req.provider_model);

    LedgerRecord rec;
    rec.model = req.alias;
    rec.provider = provider;
    rec.prompt_tokens = prompt;
    rec.completion_tokens = completion;
    rec.total_tokens = total;
    rec.cost = cost;
    rec.duration_ms = elapsed;
    rec.request_data = to_wire(req.log_params);
    rec.response_data = to_wire(response.body);
    record(rec);

    utils::log::info(std::format("LLM Response: {} ({}) | {}ms | {}->{} tokens ({} total) | ${:.4f}",
        req.alias, provider, elapsed, prompt, completion, total, cost));
    return EngineResponse{200, std::move(response.body)};
}

EngineResponse ExecutionEngine::handle(std::string_view body) {
    return execute(prepare(body));
}

// ============================================================================
// Streaming
// ============================================================================

void ExecutionEngine::execute_stream(const PreparedRequest& prepared, IStreamSink& sink) {
    if (!prepared.ok()) {
        sink.try_send(sse_frame(to_wire(prepared.rejection.body)));
        sink.try_send(kSseDoneFrame);
        return;
    }

    streamed_requests_.fetch_add(1, std::memory_order_relaxed);
    const auto& req = *prepared.resolved;

    StreamAccumulator acc(req.provider_model);
    std::optional<std::string> stream_error;
    bool client_gone = false;

    // Ledger write, once, after the terminal frame has been settled
    DeferredStep finalize([&]() noexcept {
        const auto elapsed = duration_ms(prepared);
        try {
            LedgerRecord rec;
            rec.model = req.alias;
            rec.provider = req.provider;
            rec.duration_ms = elapsed;
            rec.request_data = to_wire(req.log_params);
            rec.response_data = to_wire(acc.response());
            rec.error = stream_error;
            if (!stream_error) {
                rec.prompt_tokens = acc.prompt_tokens();
                rec.completion_tokens = acc.completion_tokens();
                rec.total_tokens = acc.total_tokens();
                rec.cost = compute_cost(acc.response(), req.provider_model);
            }
            record(rec);

            if (stream_error) {
                utils::log::error(std::format("LLM Response: {} ({}) | {}ms | Error: {}",
                    req.alias, req.provider, elapsed, *stream_error));
            } else {
                utils::log::info(std::format(
                    "LLM Response: {} ({}) | {}ms | {}->{} tokens ({} total) | ${:.4f} [streaming]",
                    req.alias, req.provider, elapsed, rec.prompt_tokens, rec.completion_tokens,
                    rec.total_tokens, rec.cost));
            }
        } catch (const std::exception& e) {
            ledger_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Error logging streaming request for '{}': {}", req.alias, e.what()));
        }
    });

    const auto forward = [&](std::string_view frame) {
        if (client_gone) return;
        if (!sink.is_open() || !sink.try_send(frame)) {
            client_gone = true;
            client_disconnects_.fetch_add(1, std::memory_order_relaxed);
            utils::log::info(std::format("Client disconnected during streaming: {} after {} chunk(s)",
                                         req.alias, acc.chunk_count()));
        }
    };

    try {
        c_.provider->stream(req.params, [&](const nlohmann::json& chunk) {
            acc.add(chunk);
            forward(sse_frame(to_wire(chunk)));
        });
    } catch (const std::exception& e) {
        provider_errors_.fetch_add(1, std::memory_order_relaxed);
        const auto classification = classifier().classify(e);
        const auto message = extract_error_message(e.what());
        auto error_body = build_error_body(message, classification);

        stream_error = std::format("{}: {}", error_name(e), message);
        acc.set_error(error_body["error"]);
        forward(sse_frame(to_wire(error_body)));
    }

    forward(kSseDoneFrame);
}

} // namespace llmproxy
