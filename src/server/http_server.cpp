#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/stats_handler.hpp"
#include "core/execution_engine.hpp"
#include "core/utils.hpp"
#include "finops/pricing_catalog.hpp"
#include "routing/model_route_table.hpp"
#include "routing/provider_inference.hpp"

// cpp-httplib is header-only; silence its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace llmproxy {

namespace {

std::string to_wire(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// Adapts a cpp-httplib DataSink to the engine's best-effort sink
class HttpStreamSink final : public IStreamSink {
public:
    explicit HttpStreamSink(httplib::DataSink& sink) : sink_(sink) {}

    bool is_open() const override {
        return !sink_.is_writable || sink_.is_writable();
    }

    bool try_send(std::string_view frame) noexcept override {
        try {
            return sink_.write(frame.data(), frame.size());
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Stream write failed: {}", e.what()));
            return false;
        }
    }

private:
    httplib::DataSink& sink_;
};

/// Stands in for a client that went away before the first byte
class ClosedStreamSink final : public IStreamSink {
public:
    bool is_open() const override { return false; }
    bool try_send(std::string_view) noexcept override { return false; }
};

/**
 * State shared by the content provider and its releaser. cpp-httplib skips
 * the provider when the connection dies first; the releaser then runs the
 * stream against a closed sink so the request is still ledgered.
 */
struct StreamState {
    StreamState(std::shared_ptr<ExecutionEngine> e, PreparedRequest p, RequestGuard g)
        : engine(std::move(e)), prepared(std::move(p)), guard(std::move(g)) {}

    void run(IStreamSink& sink) {
        if (ran) return;
        ran = true;
        engine->execute_stream(prepared, sink);
    }

    std::shared_ptr<ExecutionEngine> engine;
    PreparedRequest prepared;
    RequestGuard guard;
    bool ran = false;
};

nlohmann::json price_or_null(std::optional<double> route_price, std::optional<double> catalog_price) {
    const auto price = route_price ? route_price : catalog_price;
    if (!price) return nullptr;
    return utils::round_to(*price, 2);
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(
    std::shared_ptr<ExecutionEngine> engine,
    std::string host,
    int port,
    size_t thread_pool_size)
    : engine_(std::move(engine)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size),
      server_(std::make_unique<httplib::Server>()) {
    if (!engine_) throw std::invalid_argument("HttpServer requires an execution engine");
    stats_handler_ = std::make_unique<StatsHandler>(engine_->ledger());
}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    auto& svr = *server_;

    // One worker per in-flight request; provider calls block the worker
    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_chat_routes(svr);
    register_admin_routes(svr);
    stats_handler_->register_routes(svr);

    utils::log::info(std::format("Starting LLM Proxy on {}:{} ({} threads, {} model(s))",
        host_, port_, thread_pool_size_, engine_->routes()->size()));

    if (!svr.listen(host_.c_str(), port_)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        .chat_requests = chat_requests_.load(std::memory_order_relaxed),
        .stream_requests = stream_requests_.load(std::memory_order_relaxed),
        .shutdown_rejects = shutdown_rejects_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_chat_routes(httplib::Server& svr) {
    const auto chat = [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat_completions(req, res);
    };
    svr.Post(http::kChatCompletionsPath, chat);
    svr.Post(http::kChatCompletionsShortPath, chat);
}

void HttpServer::register_admin_routes(httplib::Server& svr) {
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });
}

// ============================================================================
// Handler: POST /v1/chat/completions
// ============================================================================

void HttpServer::handle_chat_completions(const httplib::Request& req, httplib::Response& res) {
    RequestGuard guard{shutdown_coordinator_.get()};
    if (!guard.admitted()) {
        shutdown_rejects_.fetch_add(1, std::memory_order_relaxed);
        const auto response = engine_->reject_unavailable(req.body, "Server shutting down");
        res.status = response.status;
        res.set_content(to_wire(response.body), http::kJsonContentType);
        return;
    }
    chat_requests_.fetch_add(1, std::memory_order_relaxed);

    auto prepared = engine_->prepare(req.body);
    if (!prepared.streaming()) {
        const auto response = engine_->execute(prepared);
        res.status = response.status;
        res.set_content(to_wire(response.body), http::kJsonContentType);
        return;
    }

    stream_requests_.fetch_add(1, std::memory_order_relaxed);
    auto state = std::make_shared<StreamState>(engine_, std::move(prepared), std::move(guard));

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        http::kEventStreamContentType,
        [state](size_t /*offset*/, httplib::DataSink& sink) {
            HttpStreamSink out(sink);
            state->run(out);
            sink.done();
            return true;
        },
        [state](bool /*success*/) {
            ClosedStreamSink closed;
            state->run(closed);
            state->guard.release();
        });
}

// ============================================================================
// Handler: GET /health, GET /models
// ============================================================================

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(R"({"status":"ok"})", http::kJsonContentType);
}

void HttpServer::handle_models(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto pricing = engine_->pricing();
    auto models = nlohmann::json::array();

    for (const auto& route : engine_->routes()->list()) {
        const auto catalog = pricing->lookup(route.provider_model);
        models.push_back({
            {"name", route.alias},
            {"litellm_model", route.provider_model},
            {"provider", infer_provider_from_model(route.provider_model)},
            {"input_cost_per_million", price_or_null(
                route.input_cost_per_million,
                catalog ? std::optional(catalog->input_cost_per_million) : std::nullopt)},
            {"output_cost_per_million", price_or_null(
                route.output_cost_per_million,
                catalog ? std::optional(catalog->output_cost_per_million) : std::nullopt)},
            {"enabled", route.enabled},
        });
    }

    res.set_content(to_wire(nlohmann::json{{"models", std::move(models)}}), http::kJsonContentType);
}

} // namespace llmproxy
