#include "ledger/ledger_types.hpp"

namespace llmproxy {

namespace {

nlohmann::json optional_string(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const StoredRequest& r) {
    j = {
        {"timestamp", r.timestamp},
        {"model", r.model},
        {"provider", r.provider},
        {"prompt_tokens", r.prompt_tokens},
        {"completion_tokens", r.completion_tokens},
        {"total_tokens", r.total_tokens},
        {"cost", r.cost},
        {"duration_ms", r.duration_ms},
        {"request_data", r.request_data},
        {"response_data", optional_string(r.response_data)},
    };
}

void to_json(nlohmann::json& j, const RequestPage& p) {
    j = {
        {"requests", p.requests},
        {"total", p.total},
        {"total_tokens", p.total_tokens},
        {"total_cost", p.total_cost},
        {"avg_cost", p.avg_cost},
        {"offset", p.offset},
        {"limit", p.limit},
    };
}

void to_json(nlohmann::json& j, const UsageStats& s) {
    nlohmann::json by_model = nlohmann::json::array();
    for (const auto& m : s.by_model) {
        by_model.push_back({{"model", m.model}, {"provider", m.provider},
                            {"requests", m.requests}, {"cost", m.cost}, {"tokens", m.tokens}});
    }

    nlohmann::json by_provider = nlohmann::json::array();
    for (const auto& p : s.by_provider) {
        by_provider.push_back({{"provider", p.provider}, {"requests", p.requests},
                               {"cost", p.cost}, {"tokens", p.tokens}});
    }

    nlohmann::json performance = nlohmann::json::array();
    for (const auto& p : s.performance) {
        performance.push_back({
            {"model", p.model},
            {"requests", p.requests},
            {"avg_tokens_per_sec", p.avg_tokens_per_sec},
            {"avg_duration_ms", p.avg_duration_ms},
            {"min_tokens_per_sec", p.min_tokens_per_sec},
            {"max_tokens_per_sec", p.max_tokens_per_sec},
            {"avg_cost_per_request", p.avg_cost_per_request},
        });
    }

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : s.recent_errors) {
        errors.push_back({{"timestamp", e.timestamp}, {"model", e.model}, {"error", e.error}});
    }

    j = {
        {"totals", {
            {"requests", s.totals.requests},
            {"cost", s.totals.cost},
            {"prompt_tokens", s.totals.prompt_tokens},
            {"completion_tokens", s.totals.completion_tokens},
            {"avg_duration_ms", s.totals.avg_duration_ms},
        }},
        {"by_model", std::move(by_model)},
        {"by_provider", std::move(by_provider)},
        {"performance", std::move(performance)},
        {"recent_errors", std::move(errors)},
    };
}

void to_json(nlohmann::json& j, const BucketModelUsage& b) {
    j = {{"provider", b.provider}, {"model", b.model}, {"requests", b.requests}, {"cost", b.cost}};
}

void to_json(nlohmann::json& j, const DailyBucket& b) {
    j = {
        {"date", b.date},
        {"requests", b.requests},
        {"cost", b.cost},
        {"total_tokens", b.total_tokens},
        {"by_model", b.by_model},
    };
}

void to_json(nlohmann::json& j, const DailyStats& s) {
    j = {
        {"daily", s.daily},
        {"total_days", s.total_days},
        {"total_cost", s.total_cost},
        {"total_requests", s.total_requests},
    };
}

void to_json(nlohmann::json& j, const HourlyBucket& b) {
    j = {
        {"hour", b.hour},
        {"requests", b.requests},
        {"cost", b.cost},
        {"total_tokens", b.total_tokens},
        {"by_model", b.by_model},
    };
}

void to_json(nlohmann::json& j, const HourlyStats& s) {
    j = {
        {"hourly", s.hourly},
        {"date", s.date},
        {"total_cost", s.total_cost},
        {"total_requests", s.total_requests},
    };
}

void to_json(nlohmann::json& j, const DateRangeInfo& r) {
    j = {{"start_date", optional_string(r.start_date)}, {"end_date", optional_string(r.end_date)}};
}

} // namespace llmproxy
