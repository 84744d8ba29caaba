#pragma once

/// @file analysis_job_engine.h
/// @brief Asynchronous multi-KPI deep analysis over stored run reports

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

#include "analytics/kpi/accumulator.h"
#include "analytics/kpi/analysis_config.h"
#include "common/thread_pool.h"
#include "model/types.h"
#include "storage/job_store.h"
#include "storage/report_store.h"
#include "storage/source_browser.h"

namespace runlens::analytics {

/// @brief Configuration for the job engine
struct JobEngineConfig {
    /// Worker threads executing jobs (0 = hardware concurrency)
    size_t workers = 2;

    /// Error messages stored on failed jobs are cut to this length
    size_t max_error_length = 500;
};

/// @brief Parameters of one analysis request
struct JobRequest {
    std::optional<RepositoryId> repository_id;
    std::vector<std::string> kpis;
    std::optional<absl::CivilDay> date_from;
    std::optional<absl::CivilDay> date_to;
};

/// @brief Creates analysis jobs and executes them on a worker pool
///
/// CreateJob() validates synchronously and returns the pending record; the
/// worker moves it to running, folds every matching report into one
/// accumulator per selected KPI, and finishes it as completed or error.
/// Pollers read copies through GetJob()/ListJobs().
///
/// Example usage:
/// @code
///   AnalysisJobEngine engine(store, browser, jobs);
///   auto job = engine.CreateJob({std::nullopt, {"keyword_frequency"}});
///   engine.WaitForIdle();
///   auto done = engine.GetJob(job->id);
/// @endcode
class AnalysisJobEngine {
public:
    AnalysisJobEngine(std::shared_ptr<storage::ReportStore> store,
                      std::shared_ptr<storage::SourceBrowser> source_browser,
                      std::shared_ptr<storage::JobStore> jobs,
                      AnalysisConfig analysis_config = {},
                      JobEngineConfig config = {});

    /// @brief Drains queued jobs before returning
    ~AnalysisJobEngine();

    AnalysisJobEngine(const AnalysisJobEngine&) = delete;
    AnalysisJobEngine& operator=(const AnalysisJobEngine&) = delete;

    /// @brief Validate, store a pending job and schedule it
    /// @return InvalidArgument for an empty KPI list or date_from > date_to
    absl::StatusOr<AnalysisJob> CreateJob(JobRequest request);

    absl::StatusOr<AnalysisJob> GetJob(JobId id) const;

    std::vector<AnalysisJob> ListJobs(std::optional<RepositoryId> repository_id) const;

    /// @brief Execute a pending job on the calling thread
    ///
    /// Returns the job's failure, if any, after recording it on the job.
    absl::Status RunJob(JobId id);

    /// @brief Block until every scheduled job has finished
    void WaitForIdle();

    const AnalysisConfig& GetAnalysisConfig() const { return analysis_config_; }

private:
    struct ActiveKpi {
        std::string id;
        std::unique_ptr<KpiAccumulator> accumulator;
    };

    /// Body of RunJob once the job is running; @p analyzed tracks folded reports
    absl::Status Execute(const AnalysisJob& job, int64_t& analyzed);

    std::vector<ActiveKpi> BuildAccumulators(const AnalysisJob& job) const;

    absl::StatusOr<ReportData> LoadReport(const RunRecord& run) const;

    std::shared_ptr<storage::ReportStore> store_;
    std::shared_ptr<storage::SourceBrowser> source_browser_;
    std::shared_ptr<storage::JobStore> jobs_;
    AnalysisConfig analysis_config_;
    JobEngineConfig config_;

    // Declared last so queued jobs finish before the members they use go away
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace runlens::analytics
