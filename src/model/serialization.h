#pragma once

/// @file serialization.h
/// @brief JSON encoding of engine records (API responses and report dumps)

#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/types.h"

namespace runlens {

nlohmann::json ToJson(const RunRecord& run);
nlohmann::json ToJson(const TestResult& result);
nlohmann::json ToJson(const KeywordCall& call);
nlohmann::json ToJson(const OverviewSnapshot& snapshot);
nlohmann::json ToJson(const TrendPoint& point);
nlohmann::json ToJson(const SuccessRatePoint& point);
nlohmann::json ToJson(const FlakyTestEntry& entry);
nlohmann::json ToJson(const AggregationWatermark& watermark);
nlohmann::json ToJson(const AnalysisJob& job);
nlohmann::json ToJson(const KpiMeta& meta);

/// @brief Serialize a list of records into a JSON array
template <typename T>
nlohmann::json ToJsonArray(const std::vector<T>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back(ToJson(item));
    }
    return arr;
}

/// @brief Decode a run; requires "id", "repository_id", "started_at", "status"
absl::StatusOr<RunRecord> RunRecordFromJson(const nlohmann::json& j);

/// @brief Decode a test result; requires "run_id", "test_name", "status"
absl::StatusOr<TestResult> TestResultFromJson(const nlohmann::json& j);

/// @brief Decode a keyword call; requires "run_id", "test_name", "keyword_name",
/// "start_time"
absl::StatusOr<KeywordCall> KeywordCallFromJson(const nlohmann::json& j);

}  // namespace runlens
