#pragma once

/// @file report_store.h
/// @brief Read-only access to parsed execution reports

#include <optional>
#include <vector>

#include <absl/status/statusor.h>

#include "common/time_util.h"
#include "model/types.h"

namespace runlens::storage {

/// @brief Run selection; time bounds apply to finished_at and are inclusive
struct RunFilter {
    std::optional<RepositoryId> repository_id;
    std::optional<Timestamp> finished_from;
    std::optional<Timestamp> finished_to;

    /// Unfinished runs never match
    bool Matches(const RunRecord& run) const;
};

/// @brief Report store interface
///
/// Records are immutable once a run is finished, so readers need no
/// coordination beyond what the implementation provides.
class ReportStore {
public:
    virtual ~ReportStore() = default;

    /// @brief Finished runs matching the filter, ordered by finished_at then id
    virtual absl::StatusOr<std::vector<RunRecord>> ListRuns(const RunFilter& filter) = 0;

    /// @brief All test results of a run (empty for unknown runs)
    virtual absl::StatusOr<std::vector<TestResult>> GetTestResults(RunId run_id) = 0;

    /// @brief Keyword calls of a run ordered by test then start_time
    virtual absl::StatusOr<std::vector<KeywordCall>> GetKeywordCalls(RunId run_id) = 0;

    /// @brief Most recent finished_at over runs of the repository (or all)
    virtual absl::StatusOr<std::optional<Timestamp>> LatestFinishedAt(
        std::optional<RepositoryId> repository_id) = 0;
};

}  // namespace runlens::storage
