#include "ledger/usage_ledger.hpp"
#include "core/utils.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <format>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace llmproxy {

// ============================================================================
// SQLite helpers
// ============================================================================

namespace {

constexpr int kRecentErrorLimit = 10;
constexpr int kHoursPerDay = 24;

constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS requests (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    model TEXT NOT NULL,
    provider TEXT,
    prompt_tokens INTEGER,
    completion_tokens INTEGER,
    total_tokens INTEGER,
    cost REAL,
    duration_ms INTEGER,
    request_data TEXT,
    response_data TEXT,
    error TEXT
);
CREATE INDEX IF NOT EXISTS idx_timestamp ON requests(timestamp);
CREATE INDEX IF NOT EXISTS idx_date_provider ON requests(DATE(timestamp), provider) WHERE error IS NULL;
CREATE INDEX IF NOT EXISTS idx_cost ON requests(cost) WHERE error IS NULL;
)sql";

struct DbDeleter {
    void operator()(sqlite3* db) const noexcept {
        if (db) {
            sqlite3_close_v2(db);
        }
    }
};
using DbPtr = std::unique_ptr<sqlite3, DbDeleter>;

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

using SqlParam = std::variant<std::monostate, int64_t, double, std::string>;

StmtPtr prepare(sqlite3* db, const std::string& sql, const std::vector<SqlParam>& params) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::format("SQLite prepare failed: {}", sqlite3_errmsg(db)));
    }
    StmtPtr stmt(raw);

    int index = 1;
    for (const auto& param : params) {
        const int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt.get(), index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt.get(), index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt.get(), index, v);
            } else {
                return sqlite3_bind_text(stmt.get(), index, v.c_str(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::format("SQLite bind #{} failed: {}", index, sqlite3_errmsg(db)));
        }
        ++index;
    }
    return stmt;
}

template<typename RowFn>
void for_each_row(sqlite3* db, const StmtPtr& stmt, RowFn&& on_row) {
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        on_row(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::format("SQLite step failed: {}", sqlite3_errmsg(db)));
    }
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error(std::format("SQLite exec failed: {}", msg));
    }
}

std::string col_text(sqlite3_stmt* stmt, int col) {
    const auto* p = sqlite3_column_text(stmt, col);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::optional<std::string> col_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return col_text(stmt, col);
}

int64_t col_int(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);         // NULL reads as 0
}

double col_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);        // NULL reads as 0.0
}

/// AND-joined predicate plus its bound values, built in placeholder order
struct WhereClause {
    std::vector<std::string> conditions;
    std::vector<SqlParam> params;

    explicit WhereClause(std::string first) { conditions.push_back(std::move(first)); }

    void add_time(const TimeFilter& time) {
        if (time.empty()) return;
        conditions.push_back(std::format("({})", time.clause));
        for (const auto& p : time.params) params.emplace_back(p);
    }

    [[nodiscard]] std::string sql() const { return utils::join(conditions, " AND "); }
};

} // anonymous namespace

// ============================================================================
// Read connections
// ============================================================================

class UsageLedger::ReadConnection {
public:
    explicit ReadConnection(const UsageLedger& ledger) {
        if (ledger.is_memory()) {
            lock_ = std::unique_lock<std::mutex>(ledger.write_mutex_);
            db_ = ledger.writer_;
            return;
        }

        sqlite3* raw = nullptr;
        const int rc = sqlite3_open_v2(ledger.config_.path.c_str(), &raw,
                                       SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
        owned_.reset(raw);
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::format("Cannot open ledger '{}' for reading: {}",
                ledger.config_.path, raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
        }
        sqlite3_busy_timeout(raw, ledger.config_.busy_timeout_ms);
        db_ = raw;
    }

    [[nodiscard]] sqlite3* get() const { return db_; }

private:
    std::unique_lock<std::mutex> lock_;
    DbPtr owned_;
    sqlite3* db_ = nullptr;
};

// ============================================================================
// Construction
// ============================================================================

UsageLedger::UsageLedger(Config config)
    : config_(std::move(config)) {
    const int rc = sqlite3_open_v2(config_.path.c_str(), &writer_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = writer_ ? sqlite3_errmsg(writer_) : sqlite3_errstr(rc);
        sqlite3_close_v2(writer_);
        writer_ = nullptr;
        throw std::runtime_error(std::format("Cannot open ledger '{}': {}", config_.path, msg));
    }

    try {
        init_schema();
    } catch (const std::exception&) {
        sqlite3_close_v2(writer_);
        writer_ = nullptr;
        throw;
    }
    utils::log::info(std::format("Usage ledger ready: {}", config_.path));
}

UsageLedger::~UsageLedger() {
    if (writer_) {
        sqlite3_close_v2(writer_);
    }
}

void UsageLedger::init_schema() {
    sqlite3_busy_timeout(writer_, config_.busy_timeout_ms);
    if (!is_memory()) {
        exec(writer_, "PRAGMA journal_mode=WAL;");
        exec(writer_, "PRAGMA synchronous=NORMAL;");
    }
    exec(writer_, kSchemaSql);
}

int64_t UsageLedger::clamp_limit(int64_t limit) {
    return std::clamp<int64_t>(limit, 1, kMaxPageSize);
}

// ============================================================================
// Write path
// ============================================================================

bool UsageLedger::append(const LedgerRecord& record) {
    static constexpr const char* kInsertSql =
        "INSERT INTO requests (timestamp, model, provider, prompt_tokens, completion_tokens, "
        "total_tokens, cost, duration_ms, request_data, response_data, error) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const bool failed = record.error.has_value();
    std::vector<SqlParam> params = {
        record.timestamp.empty() ? utils::format_utc_timestamp(utils::now()) : record.timestamp,
        record.model.empty() ? std::string("unknown") : record.model,
        record.provider,
        failed ? int64_t{0} : record.prompt_tokens,
        failed ? int64_t{0} : record.completion_tokens,
        failed ? int64_t{0} : record.total_tokens,
        failed ? 0.0 : record.cost,
        record.duration_ms,
        record.request_data,
        record.response_data ? SqlParam{*record.response_data} : SqlParam{},
        record.error ? SqlParam{*record.error} : SqlParam{},
    };

    try {
        std::lock_guard lock(write_mutex_);
        const auto stmt = prepare(writer_, kInsertSql, params);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            utils::log::error(std::format("Ledger write failed for model '{}': {}",
                record.model, sqlite3_errmsg(writer_)));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Ledger write failed for model '{}': {}", record.model, e.what()));
        return false;
    }
}

int64_t UsageLedger::clear_errors() {
    std::lock_guard lock(write_mutex_);
    exec(writer_, "DELETE FROM requests WHERE error IS NOT NULL");
    const int64_t deleted = sqlite3_changes(writer_);
    utils::log::info(std::format("Cleared {} errored ledger record(s)", deleted));
    return deleted;
}

// ============================================================================
// Read path
// ============================================================================

RequestPage UsageLedger::query(const RequestFilter& filter) const {
    WhereClause where("error IS NULL");
    where.add_time(filter.time);
    if (filter.provider) {
        where.conditions.emplace_back("provider = ?");
        where.params.emplace_back(*filter.provider);
    }
    if (filter.model) {
        where.conditions.emplace_back("model = ?");
        where.params.emplace_back(*filter.model);
    }
    if (filter.min_cost) {
        where.conditions.emplace_back("cost >= ?");
        where.params.emplace_back(*filter.min_cost);
    }
    if (filter.max_cost) {
        where.conditions.emplace_back("cost <= ?");
        where.params.emplace_back(*filter.max_cost);
    }
    if (filter.search && !filter.search->empty()) {
        where.conditions.emplace_back(
            "(model LIKE ? OR request_data LIKE ? OR response_data LIKE ?)");
        const std::string pattern = std::format("%{}%", *filter.search);
        for (int i = 0; i < 3; ++i) where.params.emplace_back(pattern);
    }

    RequestPage page;
    page.limit = clamp_limit(filter.limit);
    page.offset = std::max<int64_t>(filter.offset, 0);

    ReadConnection conn(*this);

    const auto agg = prepare(conn.get(), std::format(
        "SELECT COUNT(*), SUM(total_tokens), SUM(cost), AVG(cost) FROM requests WHERE {}",
        where.sql()), where.params);
    for_each_row(conn.get(), agg, [&](sqlite3_stmt* row) {
        page.total = col_int(row, 0);
        page.total_tokens = col_int(row, 1);
        page.total_cost = utils::round_to(col_double(row, 2), 4);
        page.avg_cost = utils::round_to(col_double(row, 3), 6);
    });

    auto page_params = where.params;
    page_params.emplace_back(page.limit);
    page_params.emplace_back(page.offset);
    const auto rows = prepare(conn.get(), std::format(
        "SELECT timestamp, model, provider, prompt_tokens, completion_tokens, total_tokens, "
        "cost, duration_ms, request_data, response_data FROM requests WHERE {} "
        "ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?", where.sql()), page_params);
    for_each_row(conn.get(), rows, [&](sqlite3_stmt* row) {
        StoredRequest r;
        r.timestamp = col_text(row, 0);
        r.model = col_text(row, 1);
        r.provider = col_text(row, 2);
        r.prompt_tokens = col_int(row, 3);
        r.completion_tokens = col_int(row, 4);
        r.total_tokens = col_int(row, 5);
        r.cost = col_double(row, 6);
        r.duration_ms = col_int(row, 7);
        r.request_data = col_text(row, 8);
        r.response_data = col_optional_text(row, 9);
        page.requests.push_back(std::move(r));
    });

    return page;
}

UsageStats UsageLedger::stats(const TimeFilter& time) const {
    WhereClause ok("error IS NULL");
    ok.add_time(time);
    WhereClause failed("error IS NOT NULL");
    failed.add_time(time);

    UsageStats out;
    ReadConnection conn(*this);

    const auto totals = prepare(conn.get(), std::format(
        "SELECT COUNT(*), SUM(cost), SUM(prompt_tokens), SUM(completion_tokens), AVG(duration_ms) "
        "FROM requests WHERE {}", ok.sql()), ok.params);
    for_each_row(conn.get(), totals, [&](sqlite3_stmt* row) {
        out.totals.requests = col_int(row, 0);
        out.totals.cost = utils::round_to(col_double(row, 1), 4);
        out.totals.prompt_tokens = col_int(row, 2);
        out.totals.completion_tokens = col_int(row, 3);
        out.totals.avg_duration_ms = utils::round_to(col_double(row, 4), 2);
    });

    const auto by_model = prepare(conn.get(), std::format(
        "SELECT model, provider, COUNT(*), SUM(cost), SUM(total_tokens) FROM requests "
        "WHERE {} GROUP BY model, provider ORDER BY SUM(cost) DESC, model, provider",
        ok.sql()), ok.params);
    for_each_row(conn.get(), by_model, [&](sqlite3_stmt* row) {
        out.by_model.push_back(ModelUsage{
            col_text(row, 0), col_text(row, 1), col_int(row, 2),
            utils::round_to(col_double(row, 3), 4), col_int(row, 4)});
    });

    const auto by_provider = prepare(conn.get(), std::format(
        "SELECT provider, COUNT(*), SUM(cost), SUM(total_tokens) FROM requests "
        "WHERE {} GROUP BY provider ORDER BY SUM(cost) DESC, provider",
        ok.sql()), ok.params);
    for_each_row(conn.get(), by_provider, [&](sqlite3_stmt* row) {
        out.by_provider.push_back(ProviderUsage{
            col_text(row, 0), col_int(row, 1),
            utils::round_to(col_double(row, 2), 4), col_int(row, 3)});
    });

    // Throughput only over rows that can produce a finite rate
    static constexpr const char* kRate =
        "CAST(completion_tokens AS REAL) / (CAST(duration_ms AS REAL) / 1000.0)";
    const auto perf = prepare(conn.get(), std::format(
        "SELECT model, COUNT(*), AVG({0}), AVG(duration_ms), MIN({0}), MAX({0}), AVG(cost) "
        "FROM requests WHERE {1} AND completion_tokens > 0 AND duration_ms > 0 "
        "GROUP BY model ORDER BY AVG({0}) DESC, model", kRate, ok.sql()), ok.params);
    for_each_row(conn.get(), perf, [&](sqlite3_stmt* row) {
        ModelPerformance p;
        p.model = col_text(row, 0);
        p.requests = col_int(row, 1);
        p.avg_tokens_per_sec = utils::round_to(col_double(row, 2), 2);
        p.avg_duration_ms = utils::round_to(col_double(row, 3), 2);
        p.min_tokens_per_sec = utils::round_to(col_double(row, 4), 2);
        p.max_tokens_per_sec = utils::round_to(col_double(row, 5), 2);
        p.avg_cost_per_request = utils::round_to(col_double(row, 6), 6);
        out.performance.push_back(std::move(p));
    });

    auto error_params = failed.params;
    error_params.emplace_back(int64_t{kRecentErrorLimit});
    const auto errors = prepare(conn.get(), std::format(
        "SELECT timestamp, model, error FROM requests WHERE {} "
        "ORDER BY timestamp DESC, id DESC LIMIT ?", failed.sql()), error_params);
    for_each_row(conn.get(), errors, [&](sqlite3_stmt* row) {
        out.recent_errors.push_back(ErrorSummary{col_text(row, 0), col_text(row, 1), col_text(row, 2)});
    });

    return out;
}

DailyStats UsageLedger::daily_stats(const DailyWindow& window) const {
    WhereClause where("error IS NULL");
    where.add_time(window.filter);

    DailyStats out;
    ReadConnection conn(*this);

    const auto stmt = prepare(conn.get(), std::format(
        "SELECT {0} AS date, provider, model, COUNT(*), SUM(cost), SUM(total_tokens) "
        "FROM requests WHERE {1} GROUP BY {0}, provider, model "
        "ORDER BY date DESC, provider, model", window.date_expression, where.sql()), where.params);

    // Rows arrive grouped by date, newest first
    for_each_row(conn.get(), stmt, [&](sqlite3_stmt* row) {
        const auto date = col_text(row, 0);
        if (out.daily.empty() || out.daily.back().date != date) {
            out.daily.push_back(DailyBucket{date, 0, 0.0, 0, {}});
        }
        auto& bucket = out.daily.back();
        const int64_t requests = col_int(row, 3);
        const double cost = col_double(row, 4);
        bucket.requests += requests;
        bucket.cost += cost;
        bucket.total_tokens += col_int(row, 5);
        bucket.by_model.push_back(BucketModelUsage{
            col_text(row, 1), col_text(row, 2), requests, utils::round_to(cost, 4)});
    });

    double total_cost = 0.0;
    for (auto& day : out.daily) {
        day.cost = utils::round_to(day.cost, 4);
        total_cost += day.cost;
        out.total_requests += day.requests;
    }
    out.total_days = static_cast<int64_t>(out.daily.size());
    out.total_cost = utils::round_to(total_cost, 4);
    return out;
}

HourlyStats UsageLedger::hourly_stats(const HourlyWindow& window) const {
    WhereClause where("error IS NULL");
    where.add_time(window.filter);

    HourlyStats out;
    out.date = window.date;
    out.hourly.resize(kHoursPerDay);
    for (int h = 0; h < kHoursPerDay; ++h) out.hourly[h].hour = h;

    ReadConnection conn(*this);
    const auto stmt = prepare(conn.get(), std::format(
        "SELECT {0} AS hour, provider, model, COUNT(*), SUM(cost), SUM(total_tokens) "
        "FROM requests WHERE {1} GROUP BY {0}, provider, model "
        "ORDER BY hour ASC, provider, model", window.hour_expression, where.sql()), where.params);

    for_each_row(conn.get(), stmt, [&](sqlite3_stmt* row) {
        if (sqlite3_column_type(row, 0) == SQLITE_NULL) return;
        const auto hour = col_int(row, 0);
        if (hour < 0 || hour >= kHoursPerDay) return;

        auto& bucket = out.hourly[static_cast<size_t>(hour)];
        const int64_t requests = col_int(row, 3);
        const double cost = col_double(row, 4);
        bucket.requests += requests;
        bucket.cost += cost;
        bucket.total_tokens += col_int(row, 5);
        bucket.by_model.push_back(BucketModelUsage{
            col_text(row, 1), col_text(row, 2), requests, utils::round_to(cost, 4)});
    });

    double total_cost = 0.0;
    for (auto& bucket : out.hourly) {
        bucket.cost = utils::round_to(bucket.cost, 4);
        total_cost += bucket.cost;
        out.total_requests += bucket.requests;
    }
    out.total_cost = utils::round_to(total_cost, 4);
    return out;
}

DateRangeInfo UsageLedger::date_range() const {
    DateRangeInfo out;
    ReadConnection conn(*this);
    const auto stmt = prepare(conn.get(),
        "SELECT MIN(DATE(timestamp)), MAX(DATE(timestamp)) FROM requests WHERE error IS NULL", {});
    for_each_row(conn.get(), stmt, [&](sqlite3_stmt* row) {
        auto start = col_optional_text(row, 0);
        auto end = col_optional_text(row, 1);
        if (start && end) {
            out.start_date = std::move(start);
            out.end_date = std::move(end);
        }
    });
    return out;
}

} // namespace llmproxy
