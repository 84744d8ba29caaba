/// @file flaky_detector.cpp
/// @brief Flip counting and flaky test ranking

#include "analytics/flaky_detector.h"

#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_map>

#include <absl/strings/str_cat.h>

#include "analytics/stats_util.h"
#include "common/logging.h"

namespace runlens::analytics {

int CountFlips(const std::vector<TestStatus>& chronological) {
    int flips = 0;
    std::optional<TestStatus> previous;
    for (TestStatus status : chronological) {
        if (status == TestStatus::kSkip) {
            continue;
        }
        if (previous && *previous != status) {
            ++flips;
        }
        previous = status;
    }
    return flips;
}

FlakyTestDetector::FlakyTestDetector(std::shared_ptr<storage::ReportStore> store,
                                     FlakyDetectorConfig config)
    : store_(std::move(store)), config_(config) {}

absl::StatusOr<std::vector<FlakyTestEntry>> FlakyTestDetector::DetectFlaky(
    int window_days, std::optional<RepositoryId> repository_id, Timestamp now) {
    if (window_days <= 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("window_days must be positive, got ", window_days));
    }

    storage::RunFilter filter;
    filter.repository_id = repository_id;
    filter.finished_from = now - std::chrono::hours(24) * window_days;
    filter.finished_to = now;

    auto runs = store_->ListRuns(filter);
    if (!runs.ok()) {
        return runs.status();
    }

    std::vector<TestResult> results;
    for (const auto& run : *runs) {
        auto run_results = store_->GetTestResults(run.id);
        if (!run_results.ok()) {
            return run_results.status();
        }
        results.insert(results.end(), std::make_move_iterator(run_results->begin()),
                       std::make_move_iterator(run_results->end()));
    }

    auto flaky = Detect(*runs, results);
    RUNLENS_LOG_DEBUG("Flaky detection over {} runs found {} flaky tests", runs->size(),
                      flaky.size());
    return flaky;
}

std::vector<FlakyTestEntry> FlakyTestDetector::Detect(
    const std::vector<RunRecord>& runs, const std::vector<TestResult>& results) const {
    std::unordered_map<RunId, Timestamp> finished_at;
    for (const auto& run : runs) {
        if (run.finished_at) {
            finished_at.emplace(run.id, *run.finished_at);
        }
    }

    struct Observation {
        Timestamp finished_at;
        RunId run_id;
        TestStatus status;
    };

    // (suite, name) keeps the grouping deterministic
    std::map<std::pair<std::string, std::string>, std::vector<Observation>> by_test;
    for (const auto& result : results) {
        if (result.status == TestStatus::kSkip) {
            continue;
        }
        auto it = finished_at.find(result.run_id);
        if (it == finished_at.end()) {
            continue;
        }
        by_test[{result.suite_name, result.test_name}].push_back(
            Observation{it->second, result.run_id, result.status});
    }

    std::vector<FlakyTestEntry> flaky;
    for (auto& [key, observations] : by_test) {
        std::sort(observations.begin(), observations.end(),
                  [](const Observation& a, const Observation& b) {
                      return std::tie(a.finished_at, a.run_id) <
                             std::tie(b.finished_at, b.run_id);
                  });

        std::vector<TestStatus> statuses;
        statuses.reserve(observations.size());
        FlakyTestEntry entry;
        for (const auto& obs : observations) {
            statuses.push_back(obs.status);
            if (obs.status == TestStatus::kPass) {
                ++entry.pass_count;
            } else {
                ++entry.fail_count;
            }
        }

        entry.suite_name = key.first;
        entry.test_name = key.second;
        entry.total_runs = static_cast<int64_t>(statuses.size());
        entry.flip_count = CountFlips(statuses);
        if (entry.flip_count < 1 || entry.total_runs < config_.min_runs) {
            continue;
        }
        entry.flaky_rate = Percentage(static_cast<double>(entry.pass_count),
                                      static_cast<double>(entry.total_runs));
        entry.last_status = statuses.back();
        flaky.push_back(std::move(entry));
    }

    std::sort(flaky.begin(), flaky.end(), [](const FlakyTestEntry& a, const FlakyTestEntry& b) {
        if (a.flip_count != b.flip_count) {
            return a.flip_count > b.flip_count;
        }
        if (a.flaky_rate != b.flaky_rate) {
            return a.flaky_rate < b.flaky_rate;
        }
        return std::tie(a.suite_name, a.test_name) < std::tie(b.suite_name, b.test_name);
    });
    return flaky;
}

}  // namespace runlens::analytics
