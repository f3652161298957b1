#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace llmproxy {

/**
 * @brief Tracks in-flight chat requests so SIGINT/SIGTERM can wait for their
 * ledger writes before the process exits.
 *
 * A streaming request counts as in flight until its deferred ledger write has
 * run, not merely until headers were sent.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Stop admitting requests and wake any drain waiter
    void initiate_shutdown();

    /// Called at the start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    void leave_request();

    /// Blocks until all in-flight requests complete or the timeout passes.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t rejected_count() const {
        return rejected_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint64_t> rejected_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/**
 * @brief Scoped admission: enters on construction, leaves on destruction
 * when admitted. Movable so it can ride inside a streaming content provider.
 */
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator* coordinator)
        : coordinator_(coordinator),
          admitted_(coordinator == nullptr || coordinator->try_enter_request()) {}

    ~RequestGuard() { release(); }

    RequestGuard(RequestGuard&& other) noexcept
        : coordinator_(other.coordinator_), admitted_(other.admitted_) {
        other.coordinator_ = nullptr;
        other.admitted_ = false;
    }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;
    RequestGuard& operator=(RequestGuard&&) = delete;

    [[nodiscard]] bool admitted() const { return admitted_; }

    void release() {
        if (coordinator_ && admitted_) coordinator_->leave_request();
        coordinator_ = nullptr;
        admitted_ = false;
    }

private:
    ShutdownCoordinator* coordinator_;
    bool admitted_;
};

} // namespace llmproxy
