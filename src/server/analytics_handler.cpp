/// @file analytics_handler.cpp
/// @brief Statistics and analysis job API handler implementation

#include "server/analytics_handler.h"

#include <chrono>
#include <limits>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "analytics/kpi/kpi_catalog.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "model/serialization.h"

namespace runlens::server {

using json = nlohmann::json;

namespace {

constexpr std::string_view kStatsPath = "/api/v1/stats";
constexpr std::string_view kAnalysisPath = "/api/v1/stats/analysis";

absl::StatusOr<int64_t> ParseInteger(std::string_view name, std::string_view text) {
    int64_t value = 0;
    if (!absl::SimpleAtoi(text, &value)) {
        return InvalidArgumentError(absl::StrCat(name, " must be an integer, got '", text, "'"));
    }
    return value;
}

absl::StatusOr<std::optional<absl::CivilDay>> OptionalDay(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::optional<absl::CivilDay>();
    }
    if (!body[key].is_string()) {
        return InvalidArgumentError(absl::StrCat(key, " must be a YYYY-MM-DD string"));
    }
    RUNLENS_ASSIGN_OR_RETURN(absl::CivilDay day, ParseDay(body[key].get<std::string>()));
    return std::optional<absl::CivilDay>(day);
}

}  // namespace

AnalyticsHandler::AnalyticsHandler(std::shared_ptr<analytics::AggregationEngine> aggregation,
                                   std::shared_ptr<analytics::AnalysisJobEngine> jobs,
                                   Clock clock)
    : aggregation_(std::move(aggregation)),
      jobs_(std::move(jobs)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

HttpResponse AnalyticsHandler::Handle(const HttpRequest& request) {
    RUNLENS_COUNTER("runlens_http_requests_total").Increment();
    const bool get = request.method == "GET";
    const bool post = request.method == "POST";

    if (request.path == "/health") {
        return get ? HttpResponse::Ok({{"status", "healthy"}}) : HttpResponse::MethodNotAllowed();
    }
    if (request.path == "/metrics") {
        return get ? HttpResponse::Text(MetricsRegistry::Instance().ExportText())
                   : HttpResponse::MethodNotAllowed();
    }
    if (!absl::StartsWith(request.path, kStatsPath)) {
        return HttpResponse::NotFound("Endpoint not found");
    }

    std::string path = request.path.substr(kStatsPath.size());
    if (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    if (path == "/aggregate") {
        return post ? HandleAggregate(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/overview") {
        return get ? HandleOverview(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/trends") {
        return get ? HandleTrends(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/success-rate") {
        return get ? HandleSuccessRate(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/flaky") {
        return get ? HandleFlaky(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/watermark") {
        return get ? HandleWatermark(request) : HttpResponse::MethodNotAllowed();
    }
    if (path == "/analysis") {
        if (post) return HandleCreateJob(request);
        if (get) return HandleListJobs(request);
        return HttpResponse::MethodNotAllowed();
    }
    if (path == "/analysis/kpis") {
        return get ? HandleListKpis() : HttpResponse::MethodNotAllowed();
    }
    if (absl::StartsWith(path, "/analysis/")) {
        return get ? HandleGetJob(path.substr(std::string_view("/analysis/").size()))
                   : HttpResponse::MethodNotAllowed();
    }
    return HttpResponse::NotFound("Endpoint not found");
}

absl::StatusOr<AnalyticsHandler::Scope> AnalyticsHandler::ParseScope(
    const HttpRequest& request) const {
    Scope scope;
    auto it = request.query_params.find("days");
    if (it != request.query_params.end()) {
        RUNLENS_ASSIGN_OR_RETURN(int64_t days, ParseInteger("days", it->second));
        if (days < std::numeric_limits<int>::min() || days > std::numeric_limits<int>::max()) {
            return InvalidArgumentError(absl::StrCat("days out of range: ", days));
        }
        scope.days = static_cast<int>(days);
    }
    it = request.query_params.find("repository_id");
    if (it != request.query_params.end() && !it->second.empty()) {
        RUNLENS_ASSIGN_OR_RETURN(scope.repository_id, ParseInteger("repository_id", it->second));
    }
    RUNLENS_RETURN_IF_ERROR(aggregation_->ValidateWindow(scope.days));
    return scope;
}

// ============================================================================
// Aggregated statistics
// ============================================================================

HttpResponse AnalyticsHandler::HandleAggregate(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto result = aggregation_->Aggregate(scope->days, scope->repository_id, clock_());
    if (!result.ok()) {
        return HttpResponse::FromStatus(result.status());
    }
    json body = ToJson(result->overview);
    body["watermark"] = ToJson(result->watermark);
    return HttpResponse::Ok(body);
}

HttpResponse AnalyticsHandler::HandleOverview(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto overview = aggregation_->GetOverview(scope->days, scope->repository_id);
    if (!overview.ok()) {
        return HttpResponse::FromStatus(overview.status());
    }
    return HttpResponse::Ok(ToJson(*overview));
}

HttpResponse AnalyticsHandler::HandleTrends(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto trends = aggregation_->GetTrends(scope->days, scope->repository_id);
    if (!trends.ok()) {
        return HttpResponse::FromStatus(trends.status());
    }
    return HttpResponse::Ok(ToJsonArray(*trends));
}

HttpResponse AnalyticsHandler::HandleSuccessRate(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto series = aggregation_->GetSuccessRate(scope->days, scope->repository_id);
    if (!series.ok()) {
        return HttpResponse::FromStatus(series.status());
    }
    return HttpResponse::Ok(ToJsonArray(*series));
}

HttpResponse AnalyticsHandler::HandleFlaky(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto flaky = aggregation_->GetOrDetectFlaky(scope->days, scope->repository_id, clock_());
    if (!flaky.ok()) {
        return HttpResponse::FromStatus(flaky.status());
    }
    return HttpResponse::Ok(ToJsonArray(*flaky));
}

HttpResponse AnalyticsHandler::HandleWatermark(const HttpRequest& request) {
    auto scope = ParseScope(request);
    if (!scope.ok()) {
        return HttpResponse::FromStatus(scope.status());
    }
    auto stale = aggregation_->IsKeyStale(scope->days, scope->repository_id);
    if (!stale.ok()) {
        return HttpResponse::FromStatus(stale.status());
    }

    json body;
    auto watermark = aggregation_->GetWatermark(scope->days, scope->repository_id);
    if (watermark.ok()) {
        body["watermark"] = ToJson(*watermark);
    } else if (absl::IsNotFound(watermark.status())) {
        body["watermark"] = nullptr;
    } else {
        return HttpResponse::FromStatus(watermark.status());
    }
    body["stale"] = *stale;
    return HttpResponse::Ok(body);
}

// ============================================================================
// Deep analysis
// ============================================================================

HttpResponse AnalyticsHandler::HandleListKpis() {
    return HttpResponse::Ok(ToJsonArray(analytics::KpiCatalog()));
}

HttpResponse AnalyticsHandler::HandleCreateJob(const HttpRequest& request) {
    json body;
    try {
        body = json::parse(request.body.empty() ? std::string("{}") : request.body);
    } catch (const json::exception& e) {
        return HttpResponse::FromStatus(
            InvalidArgumentError(absl::StrCat("Invalid JSON: ", e.what())));
    }
    if (!body.is_object()) {
        return HttpResponse::FromStatus(InvalidArgumentError("Request body must be an object"));
    }

    analytics::JobRequest job_request;
    if (body.contains("repository_id") && !body["repository_id"].is_null()) {
        if (!body["repository_id"].is_number_integer()) {
            return HttpResponse::FromStatus(
                InvalidArgumentError("repository_id must be an integer"));
        }
        job_request.repository_id = body["repository_id"].get<RepositoryId>();
    }

    const json kpis = body.value("selected_kpis", json::array());
    if (!kpis.is_array()) {
        return HttpResponse::FromStatus(InvalidArgumentError("selected_kpis must be a list"));
    }
    for (const auto& kpi : kpis) {
        if (!kpi.is_string()) {
            return HttpResponse::FromStatus(
                InvalidArgumentError("selected_kpis entries must be strings"));
        }
        job_request.kpis.push_back(kpi.get<std::string>());
    }

    auto from = OptionalDay(body, "date_from");
    if (!from.ok()) {
        return HttpResponse::FromStatus(from.status());
    }
    auto to = OptionalDay(body, "date_to");
    if (!to.ok()) {
        return HttpResponse::FromStatus(to.status());
    }
    job_request.date_from = *from;
    job_request.date_to = *to;

    auto job = jobs_->CreateJob(std::move(job_request));
    if (!job.ok()) {
        return HttpResponse::FromStatus(job.status());
    }
    return HttpResponse::Created(ToJson(*job));
}

HttpResponse AnalyticsHandler::HandleListJobs(const HttpRequest& request) {
    std::optional<RepositoryId> repository_id;
    auto it = request.query_params.find("repository_id");
    if (it != request.query_params.end() && !it->second.empty()) {
        auto parsed = ParseInteger("repository_id", it->second);
        if (!parsed.ok()) {
            return HttpResponse::FromStatus(parsed.status());
        }
        repository_id = *parsed;
    }
    return HttpResponse::Ok(ToJsonArray(jobs_->ListJobs(repository_id)));
}

HttpResponse AnalyticsHandler::HandleGetJob(const std::string& id) {
    auto parsed = ParseInteger("job id", id);
    if (!parsed.ok()) {
        return HttpResponse::FromStatus(parsed.status());
    }
    auto job = jobs_->GetJob(*parsed);
    if (!job.ok()) {
        return HttpResponse::FromStatus(job.status());
    }
    return HttpResponse::Ok(ToJson(*job));
}

}  // namespace runlens::server
