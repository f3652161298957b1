#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace llmproxy {

class ModelRouteTable;
class PricingCatalog;

/**
 * @brief Install a reloaded config into the running components.
 *
 * Pricing overrides go in before the route table is swapped, so a request
 * that resolves a new route always finds that route's price.
 */
void apply_reloaded_config(const ProxyConfig& config, ModelRouteTable& routes, PricingCatalog& pricing);

/**
 * @brief Background config file watcher with hot-reload support
 *
 * Polls the TOML file's modification time. On change the file is reloaded
 * through ConfigLoader and, if it loads, the callback receives the new
 * ProxyConfig (typically swapping the model route table). A failed reload
 * is logged and the running configuration stays in place.
 *
 * The callback runs on the watcher thread and must be thread-safe.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const ProxyConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    /// Spawn the polling thread
    void start();

    /// Stop and join the polling thread
    void stop();

    /**
     * @brief One poll step: reload if the file changed since the last check.
     * @return true if a new config was loaded and delivered
     */
    bool poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reloads_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failure_count() const { return failures_.load(std::memory_order_relaxed); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    std::mutex poll_mutex_;
    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> failures_{0};
    std::jthread watch_thread_;
};

} // namespace llmproxy
