#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace llmproxy {

// Forward declarations
class ExecutionEngine;
class ShutdownCoordinator;
class StatsHandler;

/**
 * @brief HTTP front end of the proxy.
 *
 * Chat completions go through the ExecutionEngine; streaming requests are
 * answered from a chunked content provider that runs on the same worker
 * thread. Admin and usage routes are thin JSON wrappers over the route
 * table, the pricing catalog and the ledger.
 */
class HttpServer {
public:
    explicit HttpServer(
        std::shared_ptr<ExecutionEngine> engine,
        std::string host = "0.0.0.0",
        int port = 4000,
        size_t thread_pool_size = 8);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks in the listen loop until stop()
    void start();

    /// Stop listening; safe to call from any thread
    void stop();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> coordinator) {
        shutdown_coordinator_ = std::move(coordinator);
    }

    struct HttpStats {
        uint64_t chat_requests;
        uint64_t stream_requests;
        uint64_t shutdown_rejects;
    };

    [[nodiscard]] HttpStats get_http_stats() const;

private:
    // ── Route registration ──────────────────────────────────────────────
    void register_chat_routes(httplib::Server& svr);
    void register_admin_routes(httplib::Server& svr);

    // ── Handlers ────────────────────────────────────────────────────────
    void handle_chat_completions(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<ExecutionEngine> engine_;
    std::string host_;
    int port_;
    size_t thread_pool_size_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
    std::unique_ptr<StatsHandler> stats_handler_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> chat_requests_{0};
    std::atomic<uint64_t> stream_requests_{0};
    std::atomic<uint64_t> shutdown_rejects_{0};
};

} // namespace llmproxy
