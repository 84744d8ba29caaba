#pragma once

/// @file accumulator.h
/// @brief Fold/finalize interface shared by every deep-analysis KPI

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analytics/kpi/analysis_config.h"
#include "analytics/kpi/kpi_catalog.h"
#include "model/types.h"
#include "storage/source_browser.h"

namespace runlens::analytics {

/// @brief One run with everything recorded for it
struct ReportData {
    RunRecord run;
    std::vector<TestResult> tests;
    std::vector<KeywordCall> keywords;
};

/// @brief Structural checks before a report is folded
///
/// The run must be finished and every child record must point at it.
absl::Status ValidateReport(const ReportData& report);

/// @brief Top-level steps of one test in one report
struct TestSteps {
    std::string name;
    std::string suite;
    std::vector<std::string> steps;   ///< In start_time order
};

/// @brief Per-test step lists of a report
///
/// Every test result yields an entry; keyword calls whose test has no
/// result are grouped under an empty suite.
std::vector<TestSteps> ExtractTestSteps(const ReportData& report);

/// @brief Deep-analysis KPI accumulator
///
/// Fold() is called once per report in any order and Finalize() once at the
/// end; the result must not depend on the folding order. Each job owns its
/// accumulators, so implementations need no locking.
class KpiAccumulator {
public:
    virtual ~KpiAccumulator() = default;

    virtual KpiId Id() const = 0;

    /// @brief Whether Fold() needs run reports at all
    virtual bool NeedsReports() const { return true; }

    virtual void Fold(const ReportData& report) = 0;

    virtual absl::StatusOr<nlohmann::json> Finalize() = 0;
};

/// @brief What accumulators may depend on besides the reports
struct AccumulatorContext {
    const AnalysisConfig* config = nullptr;
    std::shared_ptr<storage::SourceBrowser> source_browser;
    std::optional<RepositoryId> repository_id;
};

/// @brief Create the accumulator for a KPI
std::unique_ptr<KpiAccumulator> CreateAccumulator(KpiId id, const AccumulatorContext& context);

}  // namespace runlens::analytics
