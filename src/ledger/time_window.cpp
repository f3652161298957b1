#include "ledger/time_window.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace llmproxy {

namespace {

constexpr int kDefaultDailyRangeDays = 30;

bool is_digits(std::string_view sv) {
    for (const char c : sv) {
        if (c < '0' || c > '9') return false;
    }
    return !sv.empty();
}

std::chrono::sys_seconds local_midnight_utc(std::chrono::sys_days day, int offset_minutes) {
    return std::chrono::sys_seconds{day} - std::chrono::minutes{offset_minutes};
}

std::string utc_midnight(std::chrono::sys_days day) {
    return format_utc(std::chrono::sys_seconds{day});
}

} // anonymous namespace

std::chrono::sys_days parse_date(std::string_view date) {
    using namespace std::chrono;

    if (date.size() != 10 || date[4] != '-' || date[7] != '-'
        || !is_digits(date.substr(0, 4)) || !is_digits(date.substr(5, 2))
        || !is_digits(date.substr(8, 2))) {
        throw std::invalid_argument(
            std::format("Invalid date '{}': expected YYYY-MM-DD", date));
    }

    const auto y = utils::parse_int<int>(date.substr(0, 4));
    const auto m = utils::parse_int<unsigned>(date.substr(5, 2));
    const auto d = utils::parse_int<unsigned>(date.substr(8, 2));

    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok()) {
        throw std::invalid_argument(std::format("Invalid date '{}': no such day", date));
    }
    return sys_days{ymd};
}

int validate_timezone_offset(int offset_minutes) {
    if (offset_minutes < -kMaxTimezoneOffsetMinutes || offset_minutes > kMaxTimezoneOffsetMinutes) {
        throw std::invalid_argument(std::format(
            "Invalid timezone_offset {}: must be within +/-{} minutes",
            offset_minutes, kMaxTimezoneOffsetMinutes));
    }
    return offset_minutes;
}

std::string format_utc(std::chrono::sys_seconds instant) {
    using namespace std::chrono;
    const auto day = floor<days>(instant);
    const year_month_day ymd{day};
    const hh_mm_ss hms{instant - day};
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

std::string format_date(std::chrono::sys_days day) {
    const std::chrono::year_month_day ymd{day};
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
}

UtcRange convert_local_date_to_utc_range(std::string_view date, int offset_minutes) {
    const auto day = parse_date(date);
    validate_timezone_offset(offset_minutes);

    const auto start = local_midnight_utc(day, offset_minutes);
    const auto end = start + std::chrono::hours{24};
    return {format_utc(start), format_utc(end)};
}

TimeFilter build_time_filter(const TimeWindow& window,
                             std::chrono::system_clock::time_point now) {
    TimeFilter filter;

    if (window.hours) {
        if (*window.hours <= 0 || *window.hours > kMaxWindowHours) {
            throw std::invalid_argument(std::format(
                "Invalid hours {}: must be between 1 and {}", *window.hours, kMaxWindowHours));
        }
        const auto since = std::chrono::floor<std::chrono::seconds>(now)
                         - std::chrono::hours{*window.hours};
        filter.clause = "timestamp >= ?";
        filter.params.push_back(format_utc(since));
        return filter;
    }

    if (window.timezone_offset) validate_timezone_offset(*window.timezone_offset);

    std::vector<std::string> conditions;
    std::optional<std::chrono::sys_days> start_day;

    if (window.start_date) {
        start_day = parse_date(*window.start_date);
        conditions.emplace_back("timestamp >= ?");
        filter.params.push_back(window.timezone_offset
            ? convert_local_date_to_utc_range(*window.start_date, *window.timezone_offset).start_utc
            : utc_midnight(*start_day));
    }

    if (window.end_date) {
        const auto end_day = parse_date(*window.end_date);
        if (start_day && end_day < *start_day) {
            throw std::invalid_argument(std::format(
                "Invalid range: end_date {} is before start_date {}",
                *window.end_date, *window.start_date));
        }
        conditions.emplace_back("timestamp < ?");
        filter.params.push_back(window.timezone_offset
            ? convert_local_date_to_utc_range(*window.end_date, *window.timezone_offset).end_utc
            : utc_midnight(end_day + std::chrono::days{1}));
    }

    filter.clause = utils::join(conditions, " AND ");
    return filter;
}

std::string date_group_expression(std::optional<int> offset_minutes) {
    if (!offset_minutes) return "DATE(timestamp)";
    return std::format("DATE(timestamp, '{:+d} minutes')",
                       validate_timezone_offset(*offset_minutes));
}

std::string hour_group_expression(std::optional<int> offset_minutes) {
    if (!offset_minutes) return "CAST(strftime('%H', timestamp) AS INTEGER)";
    return std::format("CAST(strftime('%H', timestamp, '{:+d} minutes') AS INTEGER)",
                       validate_timezone_offset(*offset_minutes));
}

DailyWindow daily_window(std::optional<std::string> start_date,
                         std::optional<std::string> end_date,
                         std::optional<int> offset_minutes,
                         std::chrono::system_clock::time_point now) {
    const auto today = std::chrono::floor<std::chrono::days>(now);

    DailyWindow out;
    out.end_date = end_date ? std::move(*end_date) : format_date(today);
    out.start_date = start_date
        ? std::move(*start_date)
        : format_date(today - std::chrono::days{kDefaultDailyRangeDays});

    TimeWindow window;
    window.start_date = out.start_date;
    window.end_date = out.end_date;
    window.timezone_offset = offset_minutes;
    out.filter = build_time_filter(window, now);
    out.date_expression = date_group_expression(offset_minutes);
    return out;
}

HourlyWindow hourly_window(const std::string& date, std::optional<int> offset_minutes) {
    HourlyWindow out;
    out.date = date;

    TimeWindow window;
    window.start_date = date;
    window.end_date = date;
    window.timezone_offset = offset_minutes;
    out.filter = build_time_filter(window);
    out.hour_expression = hour_group_expression(offset_minutes);
    return out;
}

} // namespace llmproxy
