#pragma once

/// @file analytics_handler.h
/// @brief Routes /api/v1/stats requests to the aggregation and job engines

#include <functional>
#include <memory>
#include <optional>

#include <absl/status/statusor.h>

#include "analytics/aggregation_engine.h"
#include "analytics/analysis_job_engine.h"
#include "server/http_types.h"

namespace runlens::server {

/// @brief Stats and analysis API
///
/// Routes:
///   POST /api/v1/stats/aggregate          recompute one (days, repository) key
///   GET  /api/v1/stats/overview           cached overview
///   GET  /api/v1/stats/trends             cached daily series
///   GET  /api/v1/stats/success-rate       cached success-rate series
///   GET  /api/v1/stats/flaky              cached ranking, live when cold
///   GET  /api/v1/stats/watermark          watermark and staleness
///   GET  /api/v1/stats/analysis/kpis      KPI catalog
///   POST /api/v1/stats/analysis           create a job (201)
///   GET  /api/v1/stats/analysis           list jobs
///   GET  /api/v1/stats/analysis/{id}      one job
///   GET  /health, GET /metrics
class AnalyticsHandler {
public:
    using Clock = std::function<Timestamp()>;

    AnalyticsHandler(std::shared_ptr<analytics::AggregationEngine> aggregation,
                     std::shared_ptr<analytics::AnalysisJobEngine> jobs,
                     Clock clock = nullptr);

    HttpResponse Handle(const HttpRequest& request);

    static constexpr int kDefaultDays = 30;

private:
    struct Scope {
        int days = kDefaultDays;
        std::optional<RepositoryId> repository_id;
    };

    absl::StatusOr<Scope> ParseScope(const HttpRequest& request) const;

    HttpResponse HandleAggregate(const HttpRequest& request);
    HttpResponse HandleOverview(const HttpRequest& request);
    HttpResponse HandleTrends(const HttpRequest& request);
    HttpResponse HandleSuccessRate(const HttpRequest& request);
    HttpResponse HandleFlaky(const HttpRequest& request);
    HttpResponse HandleWatermark(const HttpRequest& request);
    HttpResponse HandleListKpis();
    HttpResponse HandleCreateJob(const HttpRequest& request);
    HttpResponse HandleListJobs(const HttpRequest& request);
    HttpResponse HandleGetJob(const std::string& id);

    std::shared_ptr<analytics::AggregationEngine> aggregation_;
    std::shared_ptr<analytics::AnalysisJobEngine> jobs_;
    Clock clock_;
};

}  // namespace runlens::server
