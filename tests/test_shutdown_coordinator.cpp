#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

using namespace llmproxy;

namespace {

ShutdownCoordinator::Config timeout_of(int ms) {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(ms);
    return cfg;
}

} // anonymous namespace

TEST_CASE("ShutdownCoordinator: admission before and after shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    REQUIRE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);

    sc.initiate_shutdown();
    CHECK(sc.is_shutting_down());
    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.rejected_count() == 1);
    CHECK(sc.in_flight_count() == 1);

    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: drain with nothing in flight is immediate", "[shutdown]") {
    ShutdownCoordinator sc(timeout_of(2000));
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
}

TEST_CASE("ShutdownCoordinator: drain waits for the last ledger write", "[shutdown]") {
    ShutdownCoordinator sc(timeout_of(5000));
    REQUIRE(sc.try_enter_request());

    std::atomic<bool> drained{false};
    std::thread waiter([&] {
        sc.initiate_shutdown();
        drained = sc.wait_for_drain();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(drained.load());

    sc.leave_request();
    waiter.join();
    CHECK(drained.load());
}

TEST_CASE("ShutdownCoordinator: drain gives up after the timeout", "[shutdown]") {
    ShutdownCoordinator sc(timeout_of(50));
    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(40));
    sc.leave_request();
}

TEST_CASE("ShutdownCoordinator: concurrent requests balance out", "[shutdown][concurrency]") {
    ShutdownCoordinator sc;
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&sc] {
            for (int i = 0; i < 500; ++i) {
                if (sc.try_enter_request()) sc.leave_request();
            }
        });
    }
    for (auto& w : workers) w.join();
    CHECK(sc.in_flight_count() == 0);
    CHECK(sc.rejected_count() == 0);
}

TEST_CASE("RequestGuard: scoped admission", "[shutdown]") {
    ShutdownCoordinator sc;

    SECTION("leaves on scope exit") {
        {
            RequestGuard guard(&sc);
            CHECK(guard.admitted());
            CHECK(sc.in_flight_count() == 1);
        }
        CHECK(sc.in_flight_count() == 0);
    }

    SECTION("release is idempotent") {
        RequestGuard guard(&sc);
        guard.release();
        guard.release();
        CHECK_FALSE(guard.admitted());
        CHECK(sc.in_flight_count() == 0);
    }

    SECTION("moving transfers the admission") {
        RequestGuard outer(&sc);
        {
            RequestGuard moved(std::move(outer));
            CHECK(moved.admitted());
            CHECK_FALSE(outer.admitted());
            CHECK(sc.in_flight_count() == 1);
        }
        CHECK(sc.in_flight_count() == 0);
    }

    SECTION("refused once shutting down") {
        sc.initiate_shutdown();
        RequestGuard guard(&sc);
        CHECK_FALSE(guard.admitted());
        CHECK(sc.in_flight_count() == 0);
    }

    SECTION("no coordinator admits everything") {
        RequestGuard guard(nullptr);
        CHECK(guard.admitted());
    }
}
