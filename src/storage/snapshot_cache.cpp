/// @file snapshot_cache.cpp
/// @brief Aggregation snapshot cache implementation

#include "storage/snapshot_cache.h"

namespace runlens::storage {

void SnapshotCache::Put(const SnapshotKey& key, AggregationSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(snapshot);
}

std::optional<AggregationSnapshot> SnapshotCache::Get(const SnapshotKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AggregationWatermark> SnapshotCache::LatestWatermark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<AggregationWatermark> latest;
    for (const auto& [key, entry] : entries_) {
        if (!latest || entry.watermark.computed_at > latest->computed_at) {
            latest = entry.watermark;
        }
    }
    return latest;
}

size_t SnapshotCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SnapshotCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

}  // namespace runlens::storage
