#pragma once

/// @file keyword_kpis.h
/// @brief Keyword usage KPIs: frequency, duration impact, library share

#include <cstdint>
#include <map>
#include <string>

#include "analytics/kpi/accumulator.h"

namespace runlens::analytics {

/// @brief Per-keyword call statistics shared by the keyword KPIs
///
/// Every recorded call counts, nested ones included. A keyword's library is
/// the one most often resolved for its calls (ties by name).
class KeywordUsageAccumulator : public KpiAccumulator {
public:
    void Fold(const ReportData& report) override;

protected:
    struct Usage {
        int64_t calls = 0;
        double total_duration = 0.0;
        std::map<std::string, int64_t> libraries;

        std::string Library() const;
    };

    std::map<std::string, Usage> usage_;
    int64_t total_calls_ = 0;
};

/// keyword_frequency
class KeywordFrequencyAccumulator : public KeywordUsageAccumulator {
public:
    explicit KeywordFrequencyAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kKeywordFrequency; }
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    const AnalysisConfig& config_;
};

/// keyword_duration_impact
class KeywordDurationAccumulator : public KeywordUsageAccumulator {
public:
    explicit KeywordDurationAccumulator(const AnalysisConfig& config) : config_(config) {}

    KpiId Id() const override { return KpiId::kKeywordDurationImpact; }
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    const AnalysisConfig& config_;
};

/// library_distribution
class LibraryDistributionAccumulator : public KpiAccumulator {
public:
    KpiId Id() const override { return KpiId::kLibraryDistribution; }
    void Fold(const ReportData& report) override;
    absl::StatusOr<nlohmann::json> Finalize() override;

private:
    struct Share {
        int64_t calls = 0;
        double total_duration = 0.0;
    };
    std::map<std::string, Share> libraries_;
    int64_t total_calls_ = 0;
};

}  // namespace runlens::analytics
