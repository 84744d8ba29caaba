#pragma once

/// @file memory_report_store.h
/// @brief In-memory report store, loadable from a JSON dump

#include <filesystem>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

#include "storage/report_store.h"

namespace runlens::storage {

/// @brief Report store holding every record in memory
///
/// Dump format:
/// @code
///   {
///     "runs":          [{"id": 1, "repository_id": 1, "started_at": "...",
///                        "finished_at": "...", "status": "passed"}],
///     "test_results":  [{"run_id": 1, "test_name": "...", "status": "PASS", ...}],
///     "keyword_calls": [{"run_id": 1, "test_name": "...", "keyword_name": "...", ...}]
///   }
/// @endcode
class MemoryReportStore : public ReportStore {
public:
    MemoryReportStore() = default;
    ~MemoryReportStore() override = default;

    MemoryReportStore(const MemoryReportStore&) = delete;
    MemoryReportStore& operator=(const MemoryReportStore&) = delete;

    /// @brief Load a dump file on top of the current contents
    absl::Status LoadFromFile(const std::filesystem::path& path);

    /// @brief Load a parsed dump document
    absl::Status LoadFromJson(const nlohmann::json& doc);

    /// @brief Insert or replace a run
    void AddRun(RunRecord run);

    /// @brief Append a test result; the parent run must exist
    absl::Status AddTestResult(TestResult result);

    /// @brief Append a keyword call; the parent run must exist
    absl::Status AddKeywordCall(KeywordCall call);

    size_t RunCount() const;

    // ReportStore
    absl::StatusOr<std::vector<RunRecord>> ListRuns(const RunFilter& filter) override;
    absl::StatusOr<std::vector<TestResult>> GetTestResults(RunId run_id) override;
    absl::StatusOr<std::vector<KeywordCall>> GetKeywordCalls(RunId run_id) override;
    absl::StatusOr<std::optional<Timestamp>> LatestFinishedAt(
        std::optional<RepositoryId> repository_id) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<RunId, RunRecord> runs_;
    std::unordered_map<RunId, std::vector<TestResult>> test_results_;
    std::unordered_map<RunId, std::vector<KeywordCall>> keyword_calls_;
};

}  // namespace runlens::storage
