#include "core/utils.hpp"
#include "core/execution_engine.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "finops/pricing_catalog.hpp"
#include "ledger/usage_ledger.hpp"
#include "provider/openai_compatible_client.hpp"
#include "routing/model_route_table.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace llmproxy;

// Global instances for signal handling and config watcher
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<ConfigWatcher> g_config_watcher;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop admitting chat requests; in-flight ones finish and get ledgered
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }

    if (g_config_watcher) {
        g_config_watcher->stop();
    }

    if (g_shutdown) {
        const bool drained = g_shutdown->wait_for_drain();
        if (drained) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("LLM Proxy starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/proxy.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::warn(std::format("Config load failed ({}); starting with defaults and no models",
                                         config_result.error_message));
        }
        const ProxyConfig& cfg = config_result.config;

        if (!utils::log::set_level(cfg.logging.level)) {
            utils::log::warn(std::format("Unknown log level '{}', keeping info", cfg.logging.level));
        }

        // =====================================================================
        // [2/5] Usage ledger
        // =====================================================================
        utils::log::info(std::format("[2/5] Opening usage ledger {}", cfg.ledger.path));
        auto ledger = std::make_shared<UsageLedger>(UsageLedger::Config{
            .path = cfg.ledger.path,
            .busy_timeout_ms = cfg.ledger.busy_timeout_ms,
        });

        // =====================================================================
        // [3/5] Routes, pricing, provider client
        // =====================================================================
        utils::log::info("[3/5] Building model routes and pricing");
        auto routes = std::make_shared<ModelRouteTable>(cfg.models, cfg.defaults);

        auto pricing = std::make_shared<PricingCatalog>();
        pricing->apply_route_overrides(cfg.models);

        OpenAICompatibleClient::Config client_cfg;
        client_cfg.api_bases = cfg.provider_api_bases;
        client_cfg.default_timeout_seconds = cfg.defaults.timeout;
        client_cfg.default_num_retries = cfg.defaults.num_retries;
        auto provider = std::make_shared<OpenAICompatibleClient>(std::move(client_cfg));

        auto engine = std::make_shared<ExecutionEngine>(EngineComponents{
            .routes = routes,
            .provider = provider,
            .ledger = ledger,
            .pricing = pricing,
        });

        for (const auto& route : routes->list()) {
            utils::log::info(std::format("  {} -> {}{}", route.alias, route.provider_model,
                                         route.enabled ? "" : " (disabled)"));
        }

        // =====================================================================
        // [4/5] HTTP server + graceful shutdown
        // =====================================================================
        utils::log::info("[4/5] HTTP server initializing...");
        g_server = std::make_shared<HttpServer>(engine, cfg.server.host, cfg.server.port,
                                                cfg.server.thread_pool_size);

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);
        g_server->set_shutdown_coordinator(g_shutdown);

        // =====================================================================
        // [5/5] Config watcher - hot-reload model routes and pricing
        // =====================================================================
        utils::log::info("[5/5] Config watcher initializing...");
        if (cfg.config_watcher.enabled) {
            g_config_watcher = std::make_shared<ConfigWatcher>(
                config_file,
                std::chrono::seconds{cfg.config_watcher.poll_interval_seconds});

            // Captures shared_ptrs to keep components alive
            g_config_watcher->set_callback([routes, pricing](const ProxyConfig& new_cfg) {
                apply_reloaded_config(new_cfg, *routes, *pricing);
            });

            g_config_watcher->start();
        } else {
            utils::log::info("Config watcher: disabled");
        }

        utils::log::info(std::format("Server ready on http://{}:{} ({} models)",
                                     cfg.server.host, cfg.server.port, routes->size()));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
