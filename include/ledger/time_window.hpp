#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmproxy {

/// Largest accepted client time-zone offset, in minutes either side of UTC
inline constexpr int kMaxTimezoneOffsetMinutes = 14 * 60;

/// Largest accepted "last N hours" window (roughly a thousand years)
inline constexpr int64_t kMaxWindowHours = int64_t{24} * 366 * 1000;

/**
 * @brief Client-supplied time range for ledger queries.
 *
 * Either a relative "last N hours" shortcut or a local date pair, each bound
 * optional. The offset is minutes east of UTC (PST = -480, JST = +540).
 */
struct TimeWindow {
    std::optional<int64_t> hours;
    std::optional<std::string> start_date;      // YYYY-MM-DD, inclusive
    std::optional<std::string> end_date;        // YYYY-MM-DD, inclusive
    std::optional<int> timezone_offset;
};

/**
 * @brief Parameterized predicate over the stored UTC `timestamp` column.
 *
 * `clause` holds `?` placeholders only; values travel in `params` and are
 * bound by the ledger. Empty clause means "no time restriction".
 */
struct TimeFilter {
    std::string clause;
    std::vector<std::string> params;

    [[nodiscard]] bool empty() const { return clause.empty(); }
};

struct UtcRange {
    std::string start_utc;      // inclusive
    std::string end_utc;        // exclusive, start + 24h
};

/// Resolved inputs for a daily rollup
struct DailyWindow {
    std::string start_date;
    std::string end_date;
    TimeFilter filter;
    std::string date_expression;
};

/// Resolved inputs for a single-day hourly rollup
struct HourlyWindow {
    std::string date;
    TimeFilter filter;
    std::string hour_expression;
};

/**
 * @brief Parse a strict "YYYY-MM-DD" calendar date
 * @throws std::invalid_argument on bad shape or a non-existent date
 */
[[nodiscard]] std::chrono::sys_days parse_date(std::string_view date);

/// @throws std::invalid_argument if outside ±kMaxTimezoneOffsetMinutes
int validate_timezone_offset(int offset_minutes);

/// "YYYY-MM-DDTHH:MM:SS" for a UTC instant
[[nodiscard]] std::string format_utc(std::chrono::sys_seconds instant);

/// "YYYY-MM-DD" for a UTC day
[[nodiscard]] std::string format_date(std::chrono::sys_days day);

/**
 * @brief Map a client-local calendar day onto its UTC half-open range.
 *
 * start = local midnight - offset, end = start + 24h. Exact to the minute,
 * with calendar rollover across month, year and leap-day boundaries.
 *
 * convert_local_date_to_utc_range("2025-10-06", -480)
 *   -> {"2025-10-06T08:00:00", "2025-10-07T08:00:00"}
 */
[[nodiscard]] UtcRange convert_local_date_to_utc_range(std::string_view date, int offset_minutes);

/**
 * @brief Build the ledger time predicate for a window.
 *
 * `hours` takes precedence and yields `timestamp >= ?` relative to `now`
 * with no local bucketing. Otherwise each date bound is converted through the
 * offset (or UTC midnight when no offset is given).
 */
[[nodiscard]] TimeFilter build_time_filter(
    const TimeWindow& window,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// SQL expression bucketing `timestamp` by local calendar date
[[nodiscard]] std::string date_group_expression(std::optional<int> offset_minutes);

/// SQL expression bucketing `timestamp` by local hour (0-23)
[[nodiscard]] std::string hour_group_expression(std::optional<int> offset_minutes);

/**
 * @brief Daily rollup window; end defaults to today (UTC) and start to 30
 * days before it.
 */
[[nodiscard]] DailyWindow daily_window(
    std::optional<std::string> start_date,
    std::optional<std::string> end_date,
    std::optional<int> offset_minutes,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

[[nodiscard]] HourlyWindow hourly_window(const std::string& date, std::optional<int> offset_minutes);

} // namespace llmproxy
