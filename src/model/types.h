#pragma once

/// @file types.h
/// @brief Core records consumed and produced by the analytics engine

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/time/civil_time.h>
#include <nlohmann/json.hpp>

#include "common/time_util.h"

namespace runlens {

using RunId = int64_t;
using RepositoryId = int64_t;
using JobId = int64_t;

/// Execution run outcome
enum class RunStatus {
    kPending,
    kRunning,
    kPassed,
    kFailed,
    kError,
    kCancelled,
    kTimeout
};

/// Single test outcome
enum class TestStatus {
    kPass,
    kFail,
    kSkip
};

/// Role of a keyword call inside a test body
enum class KeywordKind {
    kKeyword,
    kSetup,
    kTeardown,
    kControl   ///< FOR / IF / TRY bodies and similar structures
};

/// One execution of a test suite; immutable once finished
struct RunRecord {
    RunId id = 0;
    RepositoryId repository_id = 0;
    Timestamp started_at;
    std::optional<Timestamp> finished_at;
    RunStatus status = RunStatus::kPending;

    bool IsFinished() const { return finished_at.has_value(); }

    /// Wall-clock duration, 0 for unfinished runs
    double DurationSeconds() const {
        return finished_at ? SecondsBetween(started_at, *finished_at) : 0.0;
    }
};

/// Result of one test inside a run
struct TestResult {
    RunId run_id = 0;
    std::string test_name;
    std::string suite_name;
    TestStatus status = TestStatus::kPass;
    double duration_seconds = 0.0;
    std::string error_message;
    std::vector<std::string> tags;
};

/// One keyword invocation during a test
struct KeywordCall {
    RunId run_id = 0;
    std::string test_name;
    std::string keyword_name;
    std::optional<std::string> library_name;  ///< Missing in some report formats
    KeywordKind kind = KeywordKind::kKeyword;
    Timestamp start_time;
    double duration_seconds = 0.0;
    int depth = 0;

    /// Depth-0 plain keyword, i.e. a test step
    bool IsTopLevelStep() const { return depth == 0 && kind == KeywordKind::kKeyword; }
};

/// Cached dashboard KPIs for one (window, repository) key
struct OverviewSnapshot {
    int filter_days = 0;
    std::optional<RepositoryId> repository_id;
    int64_t total_runs = 0;
    int64_t passed_runs = 0;
    int64_t failed_runs = 0;
    int64_t error_runs = 0;
    double success_rate = 0.0;
    double avg_duration_seconds = 0.0;
    int64_t total_tests = 0;
    int64_t flaky_tests = 0;
    int64_t active_repos = 0;
    Timestamp computed_at;
};

/// Daily pass/fail point
struct TrendPoint {
    absl::CivilDay date;
    int64_t passed = 0;
    int64_t failed = 0;
    int64_t error = 0;
    int64_t total = 0;
    double avg_duration = 0.0;
};

/// Daily success-rate point
struct SuccessRatePoint {
    absl::CivilDay date;
    double success_rate = 0.0;
    int64_t total_runs = 0;
};

/// Ranked flaky test
struct FlakyTestEntry {
    std::string test_name;
    std::string suite_name;
    int64_t total_runs = 0;
    int64_t pass_count = 0;
    int64_t fail_count = 0;
    int64_t flip_count = 0;
    double flaky_rate = 0.0;
    TestStatus last_status = TestStatus::kPass;
};

/// Versioned "last aggregated" marker used for staleness checks
struct AggregationWatermark {
    Timestamp computed_at;
    int window_days = 0;
    std::optional<RepositoryId> repository_id;
};

enum class JobStatus {
    kPending,
    kRunning,
    kCompleted,
    kError
};

/// Deep analysis job record
struct AnalysisJob {
    JobId id = 0;
    std::optional<RepositoryId> repository_id;
    std::vector<std::string> selected_kpis;
    std::optional<absl::CivilDay> date_from;
    std::optional<absl::CivilDay> date_to;
    JobStatus status = JobStatus::kPending;
    int progress = 0;
    int64_t reports_analyzed = 0;
    std::optional<std::string> error_message;
    nlohmann::json results = nlohmann::json::object();
    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    bool IsTerminal() const {
        return status == JobStatus::kCompleted || status == JobStatus::kError;
    }
};

/// Catalog entry describing one deep-analysis KPI
struct KpiMeta {
    std::string id;
    std::string category;
    std::string name;
    std::string description;
};

// Enum <-> string helpers (wire names match the API)

std::string_view RunStatusToString(RunStatus status);
std::optional<RunStatus> RunStatusFromString(std::string_view text);

std::string_view TestStatusToString(TestStatus status);
std::optional<TestStatus> TestStatusFromString(std::string_view text);

std::string_view KeywordKindToString(KeywordKind kind);
std::optional<KeywordKind> KeywordKindFromString(std::string_view text);

std::string_view JobStatusToString(JobStatus status);

}  // namespace runlens
