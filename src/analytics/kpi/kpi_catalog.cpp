/// @file kpi_catalog.cpp
/// @brief KPI catalog entries and id lookup

#include "analytics/kpi/kpi_catalog.h"

namespace runlens::analytics {

namespace {

struct KpiDefinition {
    KpiId id;
    std::string_view key;
    std::string_view category;
    std::string_view name;
    std::string_view description;
};

constexpr KpiDefinition kDefinitions[] = {
    {KpiId::kKeywordFrequency, "keyword_frequency", "keywords", "Keyword Frequency",
     "Most used keywords ranked by call count"},
    {KpiId::kKeywordDurationImpact, "keyword_duration_impact", "keywords",
     "Keyword Duration Impact", "Keywords ranked by cumulative execution time"},
    {KpiId::kLibraryDistribution, "library_distribution", "keywords",
     "Library Distribution", "Keyword calls distributed across libraries"},
    {KpiId::kTestComplexity, "test_complexity", "test_quality", "Test Complexity",
     "Steps per test case with distribution histogram"},
    {KpiId::kAssertionDensity, "assertion_density", "test_quality", "Assertion Density",
     "Share of assertion keywords among test steps"},
    {KpiId::kTagCoverage, "tag_coverage", "test_quality", "Tag Coverage",
     "Tag distribution and untagged tests"},
    {KpiId::kErrorPatterns, "error_patterns", "maintenance", "Error Patterns",
     "Failure messages clustered by normalized pattern"},
    {KpiId::kRedundancyDetection, "redundancy_detection", "maintenance",
     "Redundancy Detection", "Keyword sequences repeated across tests"},
    {KpiId::kSourceTestStats, "source_test_stats", "source_analysis", "Source Test Statistics",
     "Test case size and step metrics from .robot sources"},
    {KpiId::kSourceLibraryDistribution, "source_library_distribution", "source_analysis",
     "Source Library Imports", "Library imports across .robot and .resource files"},
    {KpiId::kTestPassRateTrend, "test_pass_rate_trend", "execution", "Test Pass Rate",
     "Pass/fail rate per test across runs, worst first"},
    {KpiId::kSlowestTests, "slowest_tests", "execution", "Slowest Tests",
     "Tests with the highest average duration"},
    {KpiId::kFlakinessScore, "flakiness_score", "execution", "Flakiness Score",
     "Tests flipping between PASS and FAIL, ranked by transition rate"},
    {KpiId::kFailureHeatmap, "failure_heatmap", "execution", "Failure Heatmap",
     "Daily status matrix of the most failing tests"},
    {KpiId::kSuiteDurationTreemap, "suite_duration_treemap", "execution",
     "Suite Duration Treemap", "Execution time breakdown by suite"},
};

const KpiDefinition* Find(KpiId id) {
    for (const auto& def : kDefinitions) {
        if (def.id == id) {
            return &def;
        }
    }
    return nullptr;
}

}  // namespace

std::string_view KpiIdToString(KpiId id) {
    const KpiDefinition* def = Find(id);
    return def ? def->key : std::string_view("unknown");
}

std::optional<KpiId> ParseKpiId(std::string_view text) {
    for (const auto& def : kDefinitions) {
        if (def.key == text) {
            return def.id;
        }
    }
    return std::nullopt;
}

bool IsSourceKpi(KpiId id) {
    return id == KpiId::kSourceTestStats || id == KpiId::kSourceLibraryDistribution;
}

const std::vector<KpiId>& AllKpis() {
    static const std::vector<KpiId> kAll = [] {
        std::vector<KpiId> ids;
        for (const auto& def : kDefinitions) {
            ids.push_back(def.id);
        }
        return ids;
    }();
    return kAll;
}

const std::vector<KpiMeta>& KpiCatalog() {
    static const std::vector<KpiMeta> kCatalog = [] {
        std::vector<KpiMeta> catalog;
        for (const auto& def : kDefinitions) {
            catalog.push_back(KpiMeta{std::string(def.key), std::string(def.category),
                                      std::string(def.name), std::string(def.description)});
        }
        return catalog;
    }();
    return kCatalog;
}

}  // namespace runlens::analytics
