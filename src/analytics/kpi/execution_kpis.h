#pragma once

/// @file execution_kpis.h
/// @brief Execution-history KPIs built from test results across runs

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <absl/time/civil_time.h>

#include "analytics/kpi/accumulator.h"

namespace runlens::analytics {

/// test_pass_rate_trend
class PassRateTrendAccumulator : public KpiAccumulator {
public:
    explicit PassRateTrendAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kTestPassRateTrend; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    struct Counts {
        int64_t pass = 0;
        int64_t fail = 0;
        int64_t skip = 0;
        Timestamp latest_at;
        RunId latest_run = 0;
        bool has_latest = false;
        std::string suite;
    };
    const AnalysisConfig& config_;
    std::map<std::string, Counts> tests_;
};

/// slowest_tests
class SlowestTestsAccumulator : public KpiAccumulator {
public:
    explicit SlowestTestsAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kSlowestTests; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    struct Durations {
        int64_t runs = 0;
        double sum = 0.0;
        double min = 0.0;
        double max = 0.0;
        Timestamp latest_at;
        RunId latest_run = 0;
        bool has_latest = false;
        std::string suite;
    };
    const AnalysisConfig& config_;
    std::map<std::string, Durations> tests_;
};

/// flakiness_score
class FlakinessScoreAccumulator : public KpiAccumulator {
public:
    explicit FlakinessScoreAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kFlakinessScore; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    struct Observation {
        Timestamp finished_at;
        RunId run_id;
        TestStatus status;
        std::string suite;
    };
    const AnalysisConfig& config_;
    std::map<std::string, std::vector<Observation>> tests_;
};

/// failure_heatmap
class FailureHeatmapAccumulator : public KpiAccumulator {
public:
    explicit FailureHeatmapAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kFailureHeatmap; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    const AnalysisConfig& config_;
    /// (test, day) -> worst status seen that day
    std::map<std::pair<std::string, absl::CivilDay>, TestStatus> cells_;
    std::map<std::string, int64_t> failures_;
};

/// suite_duration_treemap
class SuiteDurationAccumulator : public KpiAccumulator {
public:
    explicit SuiteDurationAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kSuiteDurationTreemap; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    struct Suite {
        double total_duration = 0.0;
        int64_t test_count = 0;
    };
    const AnalysisConfig& config_;
    std::map<std::string, Suite> suites_;
};

}  // namespace runlens::analytics
