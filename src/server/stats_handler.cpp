#include "server/stats_handler.hpp"
#include "server/http_constants.hpp"
#include "ledger/usage_ledger.hpp"
#include "provider/error_classifier.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace llmproxy {

namespace {

std::optional<std::string> get_param(const QueryParams& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

template<typename T>
std::optional<T> get_int_param(const QueryParams& params, const std::string& key) {
    const auto raw = get_param(params, key);
    if (!raw) return std::nullopt;
    const auto value = utils::try_parse_int<T>(*raw);
    if (!value) {
        throw std::invalid_argument(std::format("Invalid integer for '{}': {}", key, *raw));
    }
    return value;
}

std::optional<double> get_double_param(const QueryParams& params, const std::string& key) {
    const auto raw = get_param(params, key);
    if (!raw) return std::nullopt;
    const auto value = utils::try_parse_double(*raw);
    if (!value) {
        throw std::invalid_argument(std::format("Invalid number for '{}': {}", key, *raw));
    }
    return value;
}

void send_json(httplib::Response& res, const nlohmann::json& body) {
    res.set_content(body.dump(), http::kJsonContentType);
}

void send_error(httplib::Response& res, int status, std::string_view message,
                std::string_view type, std::string_view code) {
    res.status = status;
    send_json(res, build_error_body(message, ErrorClassification{
        .status = status, .type = std::string(type), .code = std::string(code)}));
}

/// Runs a handler body, mapping parameter and ledger failures onto responses
template<typename Fn>
void guarded(httplib::Response& res, std::string_view route, Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument& e) {
        send_error(res, httplib::StatusCode::BadRequest_400, e.what(),
                   "invalid_request_error", "invalid_parameter");
    } catch (const std::exception& e) {
        utils::log::error(std::format("{} failed: {}", route, e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, e.what(),
                   "api_error", "internal_error");
    }
}

} // anonymous namespace

StatsHandler::StatsHandler(std::shared_ptr<UsageLedger> ledger)
    : ledger_(std::move(ledger)) {
    if (!ledger_) throw std::invalid_argument("StatsHandler requires a ledger");
}

// ============================================================================
// Parameter parsing
// ============================================================================

std::optional<int> StatsHandler::parse_timezone_offset(const QueryParams& params) {
    const auto offset = get_int_param<int>(params, "timezone_offset");
    if (offset) validate_timezone_offset(*offset);
    return offset;
}

TimeWindow StatsHandler::parse_time_window(const QueryParams& params) {
    TimeWindow window;
    window.hours = get_int_param<int64_t>(params, "hours");
    if (window.hours && (*window.hours <= 0 || *window.hours > kMaxWindowHours)) {
        throw std::invalid_argument(std::format("'hours' must be between 1 and {}", kMaxWindowHours));
    }
    window.start_date = get_param(params, "start_date");
    window.end_date = get_param(params, "end_date");
    window.timezone_offset = parse_timezone_offset(params);
    return window;
}

RequestFilter StatsHandler::parse_request_filter(const QueryParams& params) {
    RequestFilter filter;
    filter.time = build_time_filter(parse_time_window(params));

    filter.offset = get_int_param<int64_t>(params, "offset").value_or(0);
    if (filter.offset < 0) throw std::invalid_argument("'offset' must not be negative");
    filter.limit = UsageLedger::clamp_limit(
        get_int_param<int64_t>(params, "limit").value_or(kDefaultPageSize));

    filter.provider = get_param(params, "provider");
    filter.model = get_param(params, "model");
    filter.min_cost = get_double_param(params, "min_cost");
    filter.max_cost = get_double_param(params, "max_cost");
    filter.search = get_param(params, "search");
    return filter;
}

// ============================================================================
// Route registration
// ============================================================================

void StatsHandler::register_routes(httplib::Server& svr) {
    svr.Get("/requests", [this](const httplib::Request& req, httplib::Response& res) {
        handle_requests(req, res);
    });
    svr.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    svr.Get("/stats/daily", [this](const httplib::Request& req, httplib::Response& res) {
        handle_daily(req, res);
    });
    svr.Get("/stats/hourly", [this](const httplib::Request& req, httplib::Response& res) {
        handle_hourly(req, res);
    });
    svr.Get("/stats/date-range", [this](const httplib::Request& req, httplib::Response& res) {
        handle_date_range(req, res);
    });
    svr.Delete("/errors", [this](const httplib::Request& req, httplib::Response& res) {
        handle_clear_errors(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void StatsHandler::handle_requests(const httplib::Request& req, httplib::Response& res) {
    guarded(res, "GET /requests", [&] {
        send_json(res, ledger_->query(parse_request_filter(req.params)));
    });
}

void StatsHandler::handle_stats(const httplib::Request& req, httplib::Response& res) {
    guarded(res, "GET /stats", [&] {
        send_json(res, ledger_->stats(build_time_filter(parse_time_window(req.params))));
    });
}

void StatsHandler::handle_daily(const httplib::Request& req, httplib::Response& res) {
    guarded(res, "GET /stats/daily", [&] {
        const auto window = daily_window(get_param(req.params, "start_date"),
                                         get_param(req.params, "end_date"),
                                         parse_timezone_offset(req.params));
        send_json(res, ledger_->daily_stats(window));
    });
}

void StatsHandler::handle_hourly(const httplib::Request& req, httplib::Response& res) {
    guarded(res, "GET /stats/hourly", [&] {
        const auto date = get_param(req.params, "date");
        if (!date) throw std::invalid_argument("'date' is required (YYYY-MM-DD)");
        send_json(res, ledger_->hourly_stats(hourly_window(*date, parse_timezone_offset(req.params))));
    });
}

void StatsHandler::handle_date_range(const httplib::Request& /*req*/, httplib::Response& res) {
    guarded(res, "GET /stats/date-range", [&] {
        send_json(res, ledger_->date_range());
    });
}

void StatsHandler::handle_clear_errors(const httplib::Request& /*req*/, httplib::Response& res) {
    guarded(res, "DELETE /errors", [&] {
        send_json(res, nlohmann::json{{"deleted", ledger_->clear_errors()}});
    });
}

} // namespace llmproxy
