#pragma once

/// @file snapshot_cache.h
/// @brief Cache of aggregation results keyed by (window, repository)

#include <map>
#include <mutex>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "model/types.h"

namespace runlens::storage {

/// @brief Everything one aggregation pass produces for a key
struct AggregationSnapshot {
    OverviewSnapshot overview;
    std::vector<TrendPoint> trends;
    std::vector<SuccessRatePoint> success_rate;
    std::vector<FlakyTestEntry> flaky;
    AggregationWatermark watermark;
};

/// @brief Cache key; a missing repository means "all repositories"
struct SnapshotKey {
    int window_days = 0;
    std::optional<RepositoryId> repository_id;

    bool operator<(const SnapshotKey& other) const {
        return std::tie(window_days, repository_id) <
               std::tie(other.window_days, other.repository_id);
    }
};

/// @brief Thread-safe snapshot cache
///
/// A key holds the output of the most recent successful aggregation only;
/// Put replaces the whole entry at once so readers never observe a mix of
/// two passes.
class SnapshotCache {
public:
    SnapshotCache() = default;

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    void Put(const SnapshotKey& key, AggregationSnapshot snapshot);

    /// @brief Copy of the cached entry, nullopt if never aggregated
    std::optional<AggregationSnapshot> Get(const SnapshotKey& key) const;

    /// @brief Newest watermark across all keys
    std::optional<AggregationWatermark> LatestWatermark() const;

    size_t Size() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::map<SnapshotKey, AggregationSnapshot> entries_;
};

}  // namespace runlens::storage
