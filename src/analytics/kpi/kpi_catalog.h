#pragma once

/// @file kpi_catalog.h
/// @brief Static catalog of deep-analysis KPIs

#include <optional>
#include <string_view>
#include <vector>

#include "model/types.h"

namespace runlens::analytics {

/// @brief Deep-analysis KPI identifiers
enum class KpiId {
    // Keyword usage
    kKeywordFrequency,
    kKeywordDurationImpact,
    kLibraryDistribution,
    // Test quality
    kTestComplexity,
    kAssertionDensity,
    kTagCoverage,
    // Maintenance
    kErrorPatterns,
    kRedundancyDetection,
    // Source analysis (no runs needed)
    kSourceTestStats,
    kSourceLibraryDistribution,
    // Execution history
    kTestPassRateTrend,
    kSlowestTests,
    kFlakinessScore,
    kFailureHeatmap,
    kSuiteDurationTreemap
};

/// @brief Wire id, e.g. "keyword_frequency"
std::string_view KpiIdToString(KpiId id);

/// @brief Parse a wire id; nullopt for unknown ids
std::optional<KpiId> ParseKpiId(std::string_view text);

/// @brief KPIs computed from repository sources instead of run reports
bool IsSourceKpi(KpiId id);

/// @brief Every KPI in catalog order
const std::vector<KpiId>& AllKpis();

/// @brief Catalog entries in catalog order
const std::vector<KpiMeta>& KpiCatalog();

}  // namespace runlens::analytics
