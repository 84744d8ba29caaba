#pragma once

/// @file job_store.h
/// @brief Analysis job records and their state machine

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/types.h"

namespace runlens::storage {

/// @brief Mutex-guarded job table
///
/// Jobs move pending -> running -> {completed | error}. Every mutation of a
/// terminal job fails with FailedPrecondition, and progress never moves
/// backwards. Readers always receive copies.
class JobStore {
public:
    JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /// @brief Store a new pending job; assigns id and created_at
    AnalysisJob Create(AnalysisJob job, Timestamp now);

    /// @brief NotFound for unknown ids
    absl::StatusOr<AnalysisJob> Get(JobId id) const;

    /// @brief Jobs of a repository (all when unset), most recent first
    std::vector<AnalysisJob> List(std::optional<RepositoryId> repository_id) const;

    /// @brief Atomic pending -> running transition
    absl::Status MarkRunning(JobId id, Timestamp now);

    /// @brief Record progress of a running job
    absl::Status UpdateProgress(JobId id, int progress, int64_t reports_analyzed);

    /// @brief running -> completed with final results; progress becomes 100
    absl::Status Complete(JobId id, nlohmann::json results, int64_t reports_analyzed,
                          Timestamp now);

    /// @brief Non-terminal -> error; reports_analyzed is kept as last recorded
    absl::Status Fail(JobId id, std::string message, Timestamp now);

    size_t Size() const;

private:
    /// Locked lookup of a mutable, non-terminal job
    absl::StatusOr<AnalysisJob*> FindActive(JobId id);

    mutable std::mutex mutex_;
    std::unordered_map<JobId, AnalysisJob> jobs_;
    JobId next_id_ = 1;
};

}  // namespace runlens::storage
