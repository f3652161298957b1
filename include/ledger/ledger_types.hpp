#pragma once

#include "ledger/time_window.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmproxy {

// ============================================================================
// Request listing
// ============================================================================

inline constexpr int64_t kDefaultPageSize = 50;
inline constexpr int64_t kMaxPageSize = 200;

struct RequestFilter {
    TimeFilter time;
    int64_t offset = 0;
    int64_t limit = kDefaultPageSize;
    std::optional<std::string> provider;
    std::optional<std::string> model;
    std::optional<double> min_cost;
    std::optional<double> max_cost;
    std::optional<std::string> search;      // substring of model / request / response
};

/// A successful ledger row as returned by listings
struct StoredRequest {
    std::string timestamp;
    std::string model;
    std::string provider;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;
    double cost = 0.0;
    int64_t duration_ms = 0;
    std::string request_data;
    std::optional<std::string> response_data;
};

/// One page plus aggregates over every matching row (independent of paging)
struct RequestPage {
    std::vector<StoredRequest> requests;
    int64_t total = 0;
    int64_t total_tokens = 0;
    double total_cost = 0.0;
    double avg_cost = 0.0;
    int64_t offset = 0;
    int64_t limit = kDefaultPageSize;
};

// ============================================================================
// Aggregate statistics
// ============================================================================

struct UsageTotals {
    int64_t requests = 0;
    double cost = 0.0;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    double avg_duration_ms = 0.0;
};

struct ModelUsage {
    std::string model;
    std::string provider;
    int64_t requests = 0;
    double cost = 0.0;
    int64_t tokens = 0;
};

struct ProviderUsage {
    std::string provider;
    int64_t requests = 0;
    double cost = 0.0;
    int64_t tokens = 0;
};

/// Throughput over rows with duration_ms > 0 and completion_tokens > 0 only
struct ModelPerformance {
    std::string model;
    int64_t requests = 0;
    double avg_tokens_per_sec = 0.0;
    double avg_duration_ms = 0.0;
    double min_tokens_per_sec = 0.0;
    double max_tokens_per_sec = 0.0;
    double avg_cost_per_request = 0.0;
};

struct ErrorSummary {
    std::string timestamp;
    std::string model;
    std::string error;
};

struct UsageStats {
    UsageTotals totals;
    std::vector<ModelUsage> by_model;
    std::vector<ProviderUsage> by_provider;
    std::vector<ModelPerformance> performance;
    std::vector<ErrorSummary> recent_errors;    // newest first, at most 10
};

// ============================================================================
// Calendar rollups
// ============================================================================

struct BucketModelUsage {
    std::string provider;
    std::string model;
    int64_t requests = 0;
    double cost = 0.0;
};

struct DailyBucket {
    std::string date;
    int64_t requests = 0;
    double cost = 0.0;
    int64_t total_tokens = 0;
    std::vector<BucketModelUsage> by_model;
};

struct DailyStats {
    std::vector<DailyBucket> daily;             // newest first
    int64_t total_days = 0;
    double total_cost = 0.0;
    int64_t total_requests = 0;
};

struct HourlyBucket {
    int hour = 0;
    int64_t requests = 0;
    double cost = 0.0;
    int64_t total_tokens = 0;
    std::vector<BucketModelUsage> by_model;
};

struct HourlyStats {
    std::string date;
    std::vector<HourlyBucket> hourly;           // always 24 entries, hour 0..23
    double total_cost = 0.0;
    int64_t total_requests = 0;
};

struct DateRangeInfo {
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
};

// ---- JSON (nlohmann ADL) ---------------------------------------------------

void to_json(nlohmann::json& j, const StoredRequest& r);
void to_json(nlohmann::json& j, const RequestPage& p);
void to_json(nlohmann::json& j, const UsageStats& s);
void to_json(nlohmann::json& j, const BucketModelUsage& b);
void to_json(nlohmann::json& j, const DailyBucket& b);
void to_json(nlohmann::json& j, const DailyStats& s);
void to_json(nlohmann::json& j, const HourlyBucket& b);
void to_json(nlohmann::json& j, const HourlyStats& s);
void to_json(nlohmann::json& j, const DateRangeInfo& r);

} // namespace llmproxy
