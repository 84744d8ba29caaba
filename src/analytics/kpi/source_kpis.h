#pragma once

/// @file source_kpis.h
/// @brief KPIs computed from test sources instead of run reports

#include <memory>
#include <optional>

#include "analytics/kpi/accumulator.h"
#include "analytics/source_analyzer.h"

namespace runlens::analytics {

/// source_test_stats
class SourceTestStatsAccumulator : public KpiAccumulator {
public:
    SourceTestStatsAccumulator(std::shared_ptr<storage::SourceBrowser> browser,
                               const AnalysisConfig& config,
                               std::optional<RepositoryId> repository_id)
        : analyzer_(std::move(browser), config), repository_id_(repository_id) {}

    KpiId Id() const override { return KpiId::kSourceTestStats; }
    bool NeedsReports() const override { return false; }
    void Fold(const ReportData&) override {}
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    SourceAnalyzer analyzer_;
    std::optional<RepositoryId> repository_id_;
};

/// source_library_distribution
class SourceLibraryAccumulator : public KpiAccumulator {
public:
    SourceLibraryAccumulator(std::shared_ptr<storage::SourceBrowser> browser,
                             const AnalysisConfig& config,
                             std::optional<RepositoryId> repository_id)
        : analyzer_(std::move(browser), config), repository_id_(repository_id) {}

    KpiId Id() const override { return KpiId::kSourceLibraryDistribution; }
    bool NeedsReports() const override { return false; }
    void Fold(const ReportData&) override {}
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    SourceAnalyzer analyzer_;
    std::optional<RepositoryId> repository_id_;
};

}  // namespace runlens::analytics
