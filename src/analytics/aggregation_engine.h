#pragma once

/// @file aggregation_engine.h
/// @brief Cached dashboard statistics over rolling windows

#include <memory>
#include <optional>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "analytics/flaky_detector.h"
#include "model/types.h"
#include "storage/report_store.h"
#include "storage/snapshot_cache.h"

namespace runlens::analytics {

/// @brief Configuration for the aggregation engine
struct AggregationConfig {
    /// Accepted window sizes in days
    std::vector<int> windows = {7, 14, 30, 90, 365};

    FlakyDetectorConfig flaky;
};

/// @brief Recomputes and serves cached overview statistics
///
/// Aggregate() is the only writer: it loads the window's runs, computes the
/// overview, the daily trend and success-rate series and the flaky ranking,
/// and stores all of them under the (window, repository) key in a single
/// Put. If any step fails nothing is written and the previous entry stays.
///
/// Example usage:
/// @code
///   AggregationEngine engine(store, cache);
///   auto result = engine.Aggregate(30, std::nullopt, std::chrono::system_clock::now());
///   if (result.ok()) {
///       auto overview = engine.GetOverview(30, std::nullopt);
///   }
/// @endcode
class AggregationEngine {
public:
    AggregationEngine(std::shared_ptr<storage::ReportStore> store,
                      std::shared_ptr<storage::SnapshotCache> cache,
                      AggregationConfig config = {});

    AggregationEngine(const AggregationEngine&) = delete;
    AggregationEngine& operator=(const AggregationEngine&) = delete;

    /// @brief Recompute every statistic for the key and cache it
    /// @param window_days One of the configured windows
    /// @param repository_id Restrict to one repository, all when unset
    /// @param now End of the window
    absl::StatusOr<storage::AggregationSnapshot> Aggregate(
        int window_days, std::optional<RepositoryId> repository_id, Timestamp now);

    /// @brief InvalidArgument unless the window is configured
    absl::Status ValidateWindow(int window_days) const;

    // =========================================================================
    // Cached reads (NotFound when the key was never aggregated)
    // =========================================================================

    absl::StatusOr<OverviewSnapshot> GetOverview(
        int window_days, std::optional<RepositoryId> repository_id) const;

    absl::StatusOr<std::vector<TrendPoint>> GetTrends(
        int window_days, std::optional<RepositoryId> repository_id) const;

    absl::StatusOr<std::vector<SuccessRatePoint>> GetSuccessRate(
        int window_days, std::optional<RepositoryId> repository_id) const;

    absl::StatusOr<std::vector<FlakyTestEntry>> GetFlaky(
        int window_days, std::optional<RepositoryId> repository_id) const;

    absl::StatusOr<AggregationWatermark> GetWatermark(
        int window_days, std::optional<RepositoryId> repository_id) const;

    /// @brief Cached flaky list, or a live detection when the key is cold
    absl::StatusOr<std::vector<FlakyTestEntry>> GetOrDetectFlaky(
        int window_days, std::optional<RepositoryId> repository_id, Timestamp now);

    /// @brief Watermark of the most recent successful aggregation, any key
    std::optional<AggregationWatermark> LatestWatermark() const;

    /// @brief Whether a run finished after the watermark was taken
    ///
    /// True when there is no watermark; false when no run ever finished.
    static bool IsStale(const std::optional<AggregationWatermark>& watermark,
                        std::optional<Timestamp> latest_run_finished_at);

    /// @brief IsStale for a key, consulting the store for the latest run
    absl::StatusOr<bool> IsKeyStale(int window_days,
                                    std::optional<RepositoryId> repository_id);

    const AggregationConfig& Config() const { return config_; }

private:
    absl::StatusOr<storage::AggregationSnapshot> Lookup(
        int window_days, std::optional<RepositoryId> repository_id) const;

    std::shared_ptr<storage::ReportStore> store_;
    std::shared_ptr<storage::SnapshotCache> cache_;
    AggregationConfig config_;
    FlakyTestDetector flaky_detector_;
};

}  // namespace runlens::analytics
