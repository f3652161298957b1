#pragma once

#include "ledger/ledger_types.hpp"
#include "ledger/time_window.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace httplib { class Server; struct Request; struct Response; }

namespace llmproxy {

class UsageLedger;

/// Query string as cpp-httplib hands it over (httplib::Params)
using QueryParams = std::multimap<std::string, std::string>;

/**
 * @brief Read-only usage API over the ledger, plus the errored-record purge.
 *
 * Every time-windowed route accepts hours, start_date, end_date and
 * timezone_offset. Malformed parameters answer 400; ledger read failures
 * answer 500. Both carry the usual {"error":{...}} body.
 */
class StatsHandler {
public:
    explicit StatsHandler(std::shared_ptr<UsageLedger> ledger);

    void register_routes(httplib::Server& svr);

    // ── Query parameter parsing (throw std::invalid_argument) ──────────

    [[nodiscard]] static TimeWindow parse_time_window(const QueryParams& params);
    [[nodiscard]] static RequestFilter parse_request_filter(const QueryParams& params);
    [[nodiscard]] static std::optional<int> parse_timezone_offset(const QueryParams& params);

private:
    void handle_requests(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_daily(const httplib::Request& req, httplib::Response& res);
    void handle_hourly(const httplib::Request& req, httplib::Response& res);
    void handle_date_range(const httplib::Request& req, httplib::Response& res);
    void handle_clear_errors(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<UsageLedger> ledger_;
};

} // namespace llmproxy
