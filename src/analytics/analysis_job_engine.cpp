/// @file analysis_job_engine.cpp
/// @brief Deep analysis job scheduling and execution

#include "analytics/analysis_job_engine.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analytics/kpi/kpi_catalog.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace runlens::analytics {

namespace {

Timestamp Now() {
    return std::chrono::system_clock::now();
}

std::string Truncate(std::string message, size_t max_length) {
    if (message.size() > max_length) {
        message.resize(max_length);
    }
    return message;
}

}  // namespace

AnalysisJobEngine::AnalysisJobEngine(std::shared_ptr<storage::ReportStore> store,
                                     std::shared_ptr<storage::SourceBrowser> source_browser,
                                     std::shared_ptr<storage::JobStore> jobs,
                                     AnalysisConfig analysis_config,
                                     JobEngineConfig config)
    : store_(std::move(store)),
      source_browser_(std::move(source_browser)),
      jobs_(std::move(jobs)),
      analysis_config_(std::move(analysis_config)),
      config_(config),
      pool_(std::make_unique<ThreadPool>(config_.workers, "analysis")) {
    RUNLENS_LOG_INFO("Analysis job engine started with {} workers", pool_->Size());
}

AnalysisJobEngine::~AnalysisJobEngine() {
    pool_->Wait();
}

absl::StatusOr<AnalysisJob> AnalysisJobEngine::CreateJob(JobRequest request) {
    if (request.kpis.empty()) {
        return MakeError(ErrorCode::kValidationError, "At least one KPI must be selected");
    }
    if (request.date_from && request.date_to && *request.date_from > *request.date_to) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat("date_from ", FormatDay(*request.date_from),
                                      " is after date_to ", FormatDay(*request.date_to)));
    }

    // Duplicates are dropped, first occurrence keeps its position
    std::vector<std::string> kpis;
    std::set<std::string> seen;
    for (auto& kpi : request.kpis) {
        if (seen.insert(kpi).second) {
            kpis.push_back(std::move(kpi));
        }
    }

    AnalysisJob job;
    job.repository_id = request.repository_id;
    job.selected_kpis = std::move(kpis);
    job.date_from = request.date_from;
    job.date_to = request.date_to;
    job = jobs_->Create(std::move(job), Now());
    RUNLENS_COUNTER("runlens_jobs_created_total").Increment();

    const JobId id = job.id;
    auto scheduled = pool_->Execute([this, id]() {
        auto status = RunJob(id);
        if (!status.ok()) {
            RUNLENS_LOG_DEBUG("Analysis job {} ended with {}", id, status.ToString());
        }
    });
    if (!scheduled.ok()) {
        auto failed = jobs_->Fail(id, Truncate(std::string(scheduled.message()),
                                               config_.max_error_length), Now());
        if (!failed.ok()) {
            RUNLENS_LOG_ERROR("Could not fail unscheduled job {}: {}", id, failed.ToString());
        }
        return scheduled;
    }

    RUNLENS_LOG_INFO("Created analysis job {} for {} ({} KPIs)", id,
                     job.repository_id ? absl::StrCat("repository ", *job.repository_id)
                                       : std::string("all repositories"),
                     job.selected_kpis.size());
    return job;
}

absl::StatusOr<AnalysisJob> AnalysisJobEngine::GetJob(JobId id) const {
    return jobs_->Get(id);
}

std::vector<AnalysisJob> AnalysisJobEngine::ListJobs(
    std::optional<RepositoryId> repository_id) const {
    return jobs_->List(repository_id);
}

void AnalysisJobEngine::WaitForIdle() {
    pool_->Wait();
}

absl::Status AnalysisJobEngine::RunJob(JobId id) {
    RUNLENS_ASSIGN_OR_RETURN(AnalysisJob job, jobs_->Get(id));
    RUNLENS_RETURN_IF_ERROR(jobs_->MarkRunning(id, Now()));

    auto& running = RUNLENS_GAUGE("runlens_jobs_running");
    running.Increment();

    int64_t analyzed = 0;
    absl::Status outcome;
    try {
        outcome = Execute(job, analyzed);
    } catch (const std::exception& e) {
        outcome = InternalError(absl::StrCat("Unexpected failure: ", e.what()));
    }
    running.Decrement();

    if (outcome.ok()) {
        RUNLENS_COUNTER("runlens_jobs_completed_total").Increment();
        return outcome;
    }

    RUNLENS_COUNTER("runlens_jobs_failed_total").Increment();
    RUNLENS_LOG_ERROR("Analysis job {} failed after {} reports: {}", id, analyzed,
                      outcome.ToString());
    auto failed = jobs_->Fail(id, Truncate(std::string(outcome.message()),
                                           config_.max_error_length), Now());
    if (!failed.ok()) {
        RUNLENS_LOG_WARN("Could not record failure of job {}: {}", id, failed.ToString());
    }
    return outcome;
}

std::vector<AnalysisJobEngine::ActiveKpi> AnalysisJobEngine::BuildAccumulators(
    const AnalysisJob& job) const {
    AccumulatorContext context;
    context.config = &analysis_config_;
    context.source_browser = source_browser_;
    context.repository_id = job.repository_id;

    std::vector<ActiveKpi> active;
    for (const auto& name : job.selected_kpis) {
        auto id = ParseKpiId(name);
        if (!id) {
            RUNLENS_LOG_DEBUG("Job {}: skipping unknown KPI '{}'", job.id, name);
            continue;
        }
        active.push_back(ActiveKpi{name, CreateAccumulator(*id, context)});
    }
    return active;
}

absl::StatusOr<ReportData> AnalysisJobEngine::LoadReport(const RunRecord& run) const {
    ReportData report;
    report.run = run;
    RUNLENS_ASSIGN_OR_RETURN(report.tests, store_->GetTestResults(run.id));
    RUNLENS_ASSIGN_OR_RETURN(report.keywords, store_->GetKeywordCalls(run.id));
    RUNLENS_RETURN_IF_ERROR(ValidateReport(report));
    return report;
}

absl::Status AnalysisJobEngine::Execute(const AnalysisJob& job, int64_t& analyzed) {
    auto active = BuildAccumulators(job);

    const bool needs_reports =
        std::any_of(active.begin(), active.end(),
                    [](const ActiveKpi& kpi) { return kpi.accumulator->NeedsReports(); });

    if (needs_reports) {
        storage::RunFilter filter;
        filter.repository_id = job.repository_id;
        if (job.date_from) {
            filter.finished_from = StartOfDay(*job.date_from);
        }
        if (job.date_to) {
            filter.finished_to = EndOfDay(*job.date_to);
        }

        auto runs = store_->ListRuns(filter);
        if (!runs.ok()) {
            return runs.status();
        }

        auto& skipped = RUNLENS_COUNTER("runlens_reports_skipped_total");
        const size_t total = runs->size();
        size_t processed = 0;
        for (const auto& run : *runs) {
            auto report = LoadReport(run);
            ++processed;
            if (report.ok()) {
                for (auto& kpi : active) {
                    if (kpi.accumulator->NeedsReports()) {
                        kpi.accumulator->Fold(*report);
                    }
                }
                ++analyzed;
            } else {
                skipped.Increment();
                RUNLENS_LOG_WARN("Job {}: skipping run {}: {}", job.id, run.id,
                                 report.status().ToString());
            }

            const int progress = std::min(
                99, static_cast<int>(std::lround(100.0 * processed / total)));
            RUNLENS_RETURN_IF_ERROR(jobs_->UpdateProgress(job.id, progress, analyzed));
        }
    }

    nlohmann::json results = nlohmann::json::object();
    for (auto& kpi : active) {
        auto value = kpi.accumulator->Finalize();
        if (value.ok()) {
            results[kpi.id] = std::move(*value);
        } else {
            RUNLENS_LOG_WARN("Job {}: KPI {} failed: {}", job.id, kpi.id,
                             value.status().ToString());
            results[kpi.id] = {{"error", std::string(value.status().message())}};
        }
    }

    RUNLENS_RETURN_IF_ERROR(jobs_->Complete(job.id, std::move(results), analyzed, Now()));
    RUNLENS_LOG_INFO("Analysis job {} completed: {} reports, {} KPIs", job.id, analyzed,
                     active.size());
    return absl::OkStatus();
}

}  // namespace runlens::analytics
