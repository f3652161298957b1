#include "config/config_watcher.hpp"
#include "finops/pricing_catalog.hpp"
#include "routing/model_route_table.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmproxy {

void apply_reloaded_config(const ProxyConfig& config, ModelRouteTable& routes, PricingCatalog& pricing) {
    pricing.apply_route_overrides(config.models);
    routes.replace(config.models, config.defaults);
    if (!utils::log::set_level(config.logging.level)) {
        utils::log::warn(std::format("Unknown log level '{}'", config.logging.level));
    }
    utils::log::info(std::format("Model routes reloaded: {} model(s)", routes.size()));
}

ConfigWatcher::ConfigWatcher(std::string config_path, std::chrono::seconds poll_interval)
    : config_path_(std::move(config_path)),
      poll_interval_(poll_interval) {
    std::error_code ec;
    last_mtime_ = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Config watcher: cannot stat {}: {}", config_path_, ec.message()));
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.exchange(true)) return;
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Config watcher started: polling {} every {}s",
                                 config_path_, poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.exchange(false)) return;
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    utils::log::info("Config watcher stopped");
}

bool ConfigWatcher::poll_once() {
    std::lock_guard lock(poll_mutex_);

    std::error_code ec;
    const auto current_mtime = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Config watcher: cannot stat {}: {}", config_path_, ec.message()));
        return false;
    }
    if (current_mtime == last_mtime_) return false;

    utils::log::info(std::format("Config file changed: {}", config_path_));
    last_mtime_ = current_mtime;

    auto result = ConfigLoader::load_from_file(config_path_);
    if (!result.success) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Config reload failed (keeping old config): {}",
                                      result.error_message));
        return false;
    }

    if (callback_) {
        try {
            callback_(result.config);
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Config reload callback error: {}", e.what()));
            return false;
        }
    }
    reloads_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Config reloaded: {} model(s)", result.config.models.size()));
    return true;
}

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int i = 0; i < poll_interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        poll_once();
    }
}

} // namespace llmproxy
