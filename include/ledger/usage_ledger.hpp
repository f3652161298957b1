#pragma once

#include "core/types.hpp"
#include "ledger/ledger_types.hpp"
#include "ledger/time_window.hpp"

#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;

namespace llmproxy {

/**
 * @brief Append-only SQLite store of proxy attempts plus aggregation queries.
 *
 * Single writer: one connection, serialized by a mutex, used by append() and
 * clear_errors(). Readers open their own short-lived read-only connections,
 * and the database runs in WAL mode so reads never block the writer. An
 * in-memory database (":memory:") routes reads through the writer connection.
 *
 * All reads exclude errored rows except the recent-errors list in stats().
 * Read failures throw std::runtime_error; append() never throws.
 */
class UsageLedger {
public:
    struct Config {
        std::string path = "requests.db";
        int busy_timeout_ms = 5000;
    };

    /// Opens (creating if needed) the database and schema
    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit UsageLedger(Config config);
    ~UsageLedger();

    UsageLedger(const UsageLedger&) = delete;
    UsageLedger& operator=(const UsageLedger&) = delete;

    /**
     * @brief Write one record.
     *
     * Missing timestamp is filled with the current UTC time. Errored records
     * are stored with zero tokens and cost.
     * @return false on failure (logged, never thrown)
     */
    bool append(const LedgerRecord& record);

    /// Filtered page, newest first; limit clamped to [1, kMaxPageSize]
    [[nodiscard]] RequestPage query(const RequestFilter& filter) const;

    [[nodiscard]] UsageStats stats(const TimeFilter& time) const;

    [[nodiscard]] DailyStats daily_stats(const DailyWindow& window) const;

    /// Always 24 buckets; hours without traffic are zero-filled
    [[nodiscard]] HourlyStats hourly_stats(const HourlyWindow& window) const;

    /// First and last UTC date holding a successful record (nullopt when empty)
    [[nodiscard]] DateRangeInfo date_range() const;

    /// Delete every errored record; returns the number removed
    int64_t clear_errors();

    [[nodiscard]] static int64_t clamp_limit(int64_t limit);

    [[nodiscard]] const std::string& path() const { return config_.path; }

private:
    class ReadConnection;

    void init_schema();
    [[nodiscard]] bool is_memory() const { return config_.path == ":memory:"; }

    Config config_;
    sqlite3* writer_ = nullptr;
    mutable std::mutex write_mutex_;
};

} // namespace llmproxy
