#include <catch2/catch_test_macros.hpp>
#include "server/stats_handler.hpp"
#include "ledger/usage_ledger.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace llmproxy;
using nlohmann::json;

namespace {

/// Stats routes served on an ephemeral loopback port for the test's lifetime
class LiveServer {
public:
    explicit LiveServer(std::shared_ptr<UsageLedger> ledger)
        : handler_(std::move(ledger)) {
        handler_.register_routes(svr_);
        port_ = svr_.bind_to_any_port("127.0.0.1");
        listener_ = std::thread([this] { svr_.listen_after_bind(); });
        for (int i = 0; i < 200 && !svr_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~LiveServer() {
        svr_.stop();
        if (listener_.joinable()) listener_.join();
    }

    [[nodiscard]] int port() const { return port_; }

private:
    httplib::Server svr_;
    StatsHandler handler_;
    std::thread listener_;
    int port_ = 0;
};

} // anonymous namespace

TEST_CASE("StatsHandler: time window parameters", "[stats]") {
    SECTION("all present") {
        const auto w = StatsHandler::parse_time_window({
            {"hours", "24"}, {"start_date", "2025-10-01"}, {"end_date", "2025-10-06"},
            {"timezone_offset", "-480"}});
        CHECK(w.hours == 24);
        CHECK(w.start_date == "2025-10-01");
        CHECK(w.end_date == "2025-10-06");
        CHECK(w.timezone_offset == -480);
    }

    SECTION("empty values count as absent") {
        const auto w = StatsHandler::parse_time_window({{"hours", ""}, {"start_date", ""}});
        CHECK_FALSE(w.hours.has_value());
        CHECK_FALSE(w.start_date.has_value());
    }

    SECTION("rejections") {
        CHECK_THROWS_AS(StatsHandler::parse_time_window({{"hours", "abc"}}), std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_time_window({{"hours", "0"}}), std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_time_window({{"hours", "4000000000000000"}}),
                        std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_time_window({{"timezone_offset", "900"}}), std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_timezone_offset({{"timezone_offset", "1.5"}}), std::invalid_argument);
    }
}

TEST_CASE("StatsHandler: request filter parameters", "[stats]") {
    SECTION("defaults") {
        const auto f = StatsHandler::parse_request_filter({});
        CHECK(f.offset == 0);
        CHECK(f.limit == kDefaultPageSize);
        CHECK(f.time.empty());
        CHECK_FALSE(f.provider.has_value());
    }

    SECTION("filters and clamped limit") {
        const auto f = StatsHandler::parse_request_filter({
            {"offset", "20"}, {"limit", "5000"}, {"provider", "openai"}, {"model", "gpt-4.1"},
            {"min_cost", "0.01"}, {"max_cost", "2.5"}, {"search", "hello"}, {"hours", "6"}});
        CHECK(f.offset == 20);
        CHECK(f.limit == kMaxPageSize);
        CHECK(f.provider == "openai");
        CHECK(f.model == "gpt-4.1");
        CHECK(f.min_cost == 0.01);
        CHECK(f.max_cost == 2.5);
        CHECK(f.search == "hello");
        CHECK(f.time.clause == "timestamp >= ?");
    }

    SECTION("rejections") {
        CHECK_THROWS_AS(StatsHandler::parse_request_filter({{"offset", "-1"}}), std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_request_filter({{"min_cost", "cheap"}}), std::invalid_argument);
        CHECK_THROWS_AS(StatsHandler::parse_request_filter({{"start_date", "10/06/2025"}}),
                        std::invalid_argument);
    }
}

TEST_CASE("StatsHandler: routes over a live server", "[stats][http]") {
    auto ledger = std::make_shared<UsageLedger>(UsageLedger::Config{.path = ":memory:"});
    LedgerRecord ok;
    ok.timestamp = "2025-10-06T10:00:00";
    ok.model = "gpt-4.1";
    ok.provider = "openai";
    ok.prompt_tokens = 10;
    ok.completion_tokens = 5;
    ok.total_tokens = 15;
    ok.cost = 0.25;
    ok.duration_ms = 100;
    ok.request_data = "{}";
    REQUIRE(ledger->append(ok));
    LedgerRecord failed = ok;
    failed.error = "TimeoutError: slow";
    REQUIRE(ledger->append(failed));

    LiveServer server(ledger);
    REQUIRE(server.port() > 0);
    httplib::Client cli("127.0.0.1", server.port());

    SECTION("requests") {
        const auto res = cli.Get("/requests?limit=10");
        REQUIRE(res);
        CHECK(res->status == 200);
        const auto body = json::parse(res->body);
        CHECK(body["total"] == 1);
        CHECK(body["requests"].size() == 1);
    }

    SECTION("stats") {
        const auto res = cli.Get("/stats?start_date=2025-10-06&end_date=2025-10-06");
        REQUIRE(res);
        CHECK(res->status == 200);
        const auto body = json::parse(res->body);
        CHECK(body["recent_errors"].size() == 1);
    }

    SECTION("hourly requires a date") {
        const auto res = cli.Get("/stats/hourly");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(json::parse(res->body)["error"]["type"] == "invalid_request_error");

        const auto day = cli.Get("/stats/hourly?date=2025-10-06");
        REQUIRE(day);
        CHECK(json::parse(day->body)["hourly"].size() == 24);
    }

    SECTION("bad parameter") {
        const auto res = cli.Get("/stats/daily?timezone_offset=5000");
        REQUIRE(res);
        CHECK(res->status == 400);
    }

    SECTION("date range and error purge") {
        const auto range = cli.Get("/stats/date-range");
        REQUIRE(range);
        CHECK(json::parse(range->body)["start_date"] == "2025-10-06");

        const auto del = cli.Delete("/errors");
        REQUIRE(del);
        CHECK(json::parse(del->body)["deleted"] == 1);
    }
}
