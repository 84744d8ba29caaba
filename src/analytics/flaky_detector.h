#pragma once

/// @file flaky_detector.h
/// @brief Ranks tests whose outcome alternates between PASS and FAIL

#include <memory>
#include <optional>
#include <vector>

#include <absl/status/statusor.h>

#include "model/types.h"
#include "storage/report_store.h"

namespace runlens::analytics {

/// @brief Configuration for flaky detection
struct FlakyDetectorConfig {
    /// Minimum PASS+FAIL executions before a test can be called flaky
    int min_runs = 2;
};

/// @brief Number of adjacent PASS<->FAIL changes; SKIP entries are ignored
int CountFlips(const std::vector<TestStatus>& chronological);

/// @brief Flaky test detector
///
/// A logical test is identified by (test_name, suite_name). Its results are
/// ordered by the parent run's finished_at (ties by run id) and every change
/// between PASS and FAIL counts as one flip. A test is flaky when it has at
/// least one flip and min_runs PASS/FAIL executions.
///
/// Output is sorted by flip_count desc, flaky_rate asc, then suite and name.
class FlakyTestDetector {
public:
    explicit FlakyTestDetector(std::shared_ptr<storage::ReportStore> store,
                               FlakyDetectorConfig config = {});

    /// @brief Load the window's runs from the store and rank flaky tests
    absl::StatusOr<std::vector<FlakyTestEntry>> DetectFlaky(
        int window_days, std::optional<RepositoryId> repository_id, Timestamp now);

    /// @brief Rank flaky tests over already-loaded data
    ///
    /// Results whose run is not in @p runs (or is unfinished) are ignored.
    std::vector<FlakyTestEntry> Detect(const std::vector<RunRecord>& runs,
                                       const std::vector<TestResult>& results) const;

    const FlakyDetectorConfig& Config() const { return config_; }

private:
    std::shared_ptr<storage::ReportStore> store_;
    FlakyDetectorConfig config_;
};

}  // namespace runlens::analytics
