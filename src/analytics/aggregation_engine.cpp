/// @file aggregation_engine.cpp
/// @brief Windowed aggregation implementation

#include "analytics/aggregation_engine.h"

#include <algorithm>
#include <map>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analytics/stats_util.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace runlens::analytics {

namespace {

std::string KeyString(int window_days, std::optional<RepositoryId> repository_id) {
    return repository_id ? absl::StrCat(window_days, "d/repo ", *repository_id)
                         : absl::StrCat(window_days, "d/all");
}

struct DayBucket {
    int64_t passed = 0;
    int64_t failed = 0;
    int64_t error = 0;
    int64_t total = 0;
    double duration_sum = 0.0;
};

}  // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<storage::ReportStore> store,
                                     std::shared_ptr<storage::SnapshotCache> cache,
                                     AggregationConfig config)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      config_(std::move(config)),
      flaky_detector_(store_, config_.flaky) {}

absl::Status AggregationEngine::ValidateWindow(int window_days) const {
    if (std::find(config_.windows.begin(), config_.windows.end(), window_days) ==
        config_.windows.end()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Unsupported window of ", window_days, " days; expected one of ",
            absl::StrJoin(config_.windows, ", ")));
    }
    return absl::OkStatus();
}

absl::StatusOr<storage::AggregationSnapshot> AggregationEngine::Aggregate(
    int window_days, std::optional<RepositoryId> repository_id, Timestamp now) {
    auto valid = ValidateWindow(window_days);
    if (!valid.ok()) {
        return valid;
    }

    auto& runs_counter = RUNLENS_COUNTER("runlens_aggregations_total");
    auto& failures_counter = RUNLENS_COUNTER("runlens_aggregation_failures_total");
    ScopedTimer timer(RUNLENS_HISTOGRAM("runlens_aggregation_duration_seconds"));
    runs_counter.Increment();

    const Timestamp window_start = now - std::chrono::hours(24) * window_days;

    storage::RunFilter filter;
    filter.repository_id = repository_id;
    filter.finished_from = window_start;
    filter.finished_to = now;

    auto runs = store_->ListRuns(filter);
    if (!runs.ok()) {
        failures_counter.Increment();
        RUNLENS_LOG_ERROR("Aggregation {} failed listing runs: {}",
                          KeyString(window_days, repository_id), runs.status().ToString());
        return runs.status();
    }

    storage::AggregationSnapshot result;
    OverviewSnapshot& overview = result.overview;
    overview.filter_days = window_days;
    overview.repository_id = repository_id;
    overview.computed_at = now;

    std::vector<TestResult> all_results;
    std::set<RepositoryId> repos;
    std::map<absl::CivilDay, DayBucket> days;
    double duration_sum = 0.0;

    for (const auto& run : *runs) {
        auto results = store_->GetTestResults(run.id);
        if (!results.ok()) {
            failures_counter.Increment();
            RUNLENS_LOG_ERROR("Aggregation {} failed loading run {}: {}",
                              KeyString(window_days, repository_id), run.id,
                              results.status().ToString());
            return results.status();
        }

        ++overview.total_runs;
        repos.insert(run.repository_id);
        const double duration = run.DurationSeconds();
        duration_sum += duration;

        DayBucket& bucket = days[ToCivilDay(*run.finished_at)];
        ++bucket.total;
        bucket.duration_sum += duration;

        switch (run.status) {
            case RunStatus::kPassed:
                ++overview.passed_runs;
                ++bucket.passed;
                break;
            case RunStatus::kFailed:
                ++overview.failed_runs;
                ++bucket.failed;
                break;
            case RunStatus::kError:
                ++overview.error_runs;
                ++bucket.error;
                break;
            default:
                break;
        }

        overview.total_tests += static_cast<int64_t>(results->size());
        all_results.insert(all_results.end(), std::make_move_iterator(results->begin()),
                           std::make_move_iterator(results->end()));
    }

    overview.success_rate = Percentage(static_cast<double>(overview.passed_runs),
                                       static_cast<double>(overview.total_runs));
    overview.avg_duration_seconds = Mean1(duration_sum, overview.total_runs);
    overview.active_repos = static_cast<int64_t>(repos.size());

    // Every day of the window gets a point, empty or not
    const absl::CivilDay first_day = ToCivilDay(window_start);
    const absl::CivilDay last_day = ToCivilDay(now);
    for (absl::CivilDay day = first_day; day <= last_day; ++day) {
        TrendPoint point;
        point.date = day;
        auto it = days.find(day);
        if (it != days.end()) {
            point.passed = it->second.passed;
            point.failed = it->second.failed;
            point.error = it->second.error;
            point.total = it->second.total;
            point.avg_duration = Mean1(it->second.duration_sum, it->second.total);
        }

        SuccessRatePoint rate;
        rate.date = day;
        rate.total_runs = point.total;
        rate.success_rate = Percentage(static_cast<double>(point.passed),
                                       static_cast<double>(point.total));

        result.trends.push_back(point);
        result.success_rate.push_back(rate);
    }

    result.flaky = flaky_detector_.Detect(*runs, all_results);
    overview.flaky_tests = static_cast<int64_t>(result.flaky.size());

    result.watermark.computed_at = now;
    result.watermark.window_days = window_days;
    result.watermark.repository_id = repository_id;

    cache_->Put(storage::SnapshotKey{window_days, repository_id}, result);

    RUNLENS_LOG_INFO("Aggregated {}: {} runs, {} tests, {} flaky, success rate {}%",
                     KeyString(window_days, repository_id), overview.total_runs,
                     overview.total_tests, overview.flaky_tests, overview.success_rate);
    return result;
}

absl::StatusOr<storage::AggregationSnapshot> AggregationEngine::Lookup(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto valid = ValidateWindow(window_days);
    if (!valid.ok()) {
        return valid;
    }
    auto entry = cache_->Get(storage::SnapshotKey{window_days, repository_id});
    if (!entry) {
        return absl::NotFoundError(absl::StrCat(
            "No aggregation for ", KeyString(window_days, repository_id),
            "; trigger an aggregation first"));
    }
    return std::move(*entry);
}

absl::StatusOr<OverviewSnapshot> AggregationEngine::GetOverview(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto entry = Lookup(window_days, repository_id);
    if (!entry.ok()) {
        return entry.status();
    }
    return entry->overview;
}

absl::StatusOr<std::vector<TrendPoint>> AggregationEngine::GetTrends(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto entry = Lookup(window_days, repository_id);
    if (!entry.ok()) {
        return entry.status();
    }
    return entry->trends;
}

absl::StatusOr<std::vector<SuccessRatePoint>> AggregationEngine::GetSuccessRate(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto entry = Lookup(window_days, repository_id);
    if (!entry.ok()) {
        return entry.status();
    }
    return entry->success_rate;
}

absl::StatusOr<std::vector<FlakyTestEntry>> AggregationEngine::GetFlaky(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto entry = Lookup(window_days, repository_id);
    if (!entry.ok()) {
        return entry.status();
    }
    return entry->flaky;
}

absl::StatusOr<AggregationWatermark> AggregationEngine::GetWatermark(
    int window_days, std::optional<RepositoryId> repository_id) const {
    auto entry = Lookup(window_days, repository_id);
    if (!entry.ok()) {
        return entry.status();
    }
    return entry->watermark;
}

absl::StatusOr<std::vector<FlakyTestEntry>> AggregationEngine::GetOrDetectFlaky(
    int window_days, std::optional<RepositoryId> repository_id, Timestamp now) {
    auto cached = GetFlaky(window_days, repository_id);
    if (cached.ok() || !absl::IsNotFound(cached.status())) {
        return cached;
    }
    RUNLENS_LOG_DEBUG("No cached flaky list for {}, detecting live",
                      KeyString(window_days, repository_id));
    return flaky_detector_.DetectFlaky(window_days, repository_id, now);
}

std::optional<AggregationWatermark> AggregationEngine::LatestWatermark() const {
    return cache_->LatestWatermark();
}

bool AggregationEngine::IsStale(const std::optional<AggregationWatermark>& watermark,
                                std::optional<Timestamp> latest_run_finished_at) {
    if (!watermark) {
        return true;
    }
    if (!latest_run_finished_at) {
        return false;
    }
    return *latest_run_finished_at > watermark->computed_at;
}

absl::StatusOr<bool> AggregationEngine::IsKeyStale(int window_days,
                                                   std::optional<RepositoryId> repository_id) {
    auto valid = ValidateWindow(window_days);
    if (!valid.ok()) {
        return valid;
    }
    auto latest = store_->LatestFinishedAt(repository_id);
    if (!latest.ok()) {
        return latest.status();
    }
    std::optional<AggregationWatermark> watermark;
    if (auto entry = cache_->Get(storage::SnapshotKey{window_days, repository_id})) {
        watermark = entry->watermark;
    }
    return IsStale(watermark, *latest);
}

}  // namespace runlens::analytics
