/// @file accumulator.cpp
/// @brief Report validation, step extraction and the KPI factory

#include "analytics/kpi/accumulator.h"

#include <algorithm>
#include <map>
#include <set>

#include <absl/strings/str_cat.h>

#include "analytics/kpi/execution_kpis.h"
#include "analytics/kpi/keyword_kpis.h"
#include "analytics/kpi/source_kpis.h"
#include "analytics/kpi/test_quality_kpis.h"
#include "common/error.h"

namespace runlens::analytics {

namespace {

absl::Status Malformed(std::string_view message) {
    return MakeError(ErrorCode::kMalformedReport, message);
}

}  // namespace

absl::Status ValidateReport(const ReportData& report) {
    const RunId id = report.run.id;
    if (!report.run.IsFinished()) {
        return Malformed(absl::StrCat("Run ", id, " is not finished"));
    }
    for (const auto& test : report.tests) {
        if (test.run_id != id) {
            return Malformed(absl::StrCat(
                "Test '", test.test_name, "' belongs to run ", test.run_id, ", not ", id));
        }
        if (test.test_name.empty()) {
            return Malformed(absl::StrCat("Run ", id, " has a test result without a name"));
        }
        if (test.duration_seconds < 0) {
            return Malformed(absl::StrCat(
                "Test '", test.test_name, "' in run ", id, " has a negative duration"));
        }
    }
    for (const auto& call : report.keywords) {
        if (call.run_id != id) {
            return Malformed(absl::StrCat(
                "Keyword '", call.keyword_name, "' belongs to run ", call.run_id, ", not ", id));
        }
        if (call.duration_seconds < 0) {
            return Malformed(absl::StrCat(
                "Keyword '", call.keyword_name, "' in run ", id, " has a negative duration"));
        }
    }
    return absl::OkStatus();
}

std::vector<TestSteps> ExtractTestSteps(const ReportData& report) {
    std::map<std::string, std::vector<const KeywordCall*>> by_test;
    for (const auto& call : report.keywords) {
        if (call.IsTopLevelStep()) {
            by_test[call.test_name].push_back(&call);
        }
    }
    for (auto& [name, calls] : by_test) {
        std::stable_sort(calls.begin(), calls.end(), [](const auto* a, const auto* b) {
            return a->start_time < b->start_time;
        });
    }

    auto steps_of = [&](const std::string& name) {
        std::vector<std::string> steps;
        auto it = by_test.find(name);
        if (it != by_test.end()) {
            for (const auto* call : it->second) {
                steps.push_back(call->keyword_name);
            }
        }
        return steps;
    };

    std::vector<TestSteps> out;
    std::set<std::string> seen;
    for (const auto& test : report.tests) {
        out.push_back(TestSteps{test.test_name, test.suite_name, steps_of(test.test_name)});
        seen.insert(test.test_name);
    }
    for (const auto& [name, calls] : by_test) {
        if (seen.count(name) == 0) {
            out.push_back(TestSteps{name, "", steps_of(name)});
        }
    }
    return out;
}

std::unique_ptr<KpiAccumulator> CreateAccumulator(KpiId id, const AccumulatorContext& context) {
    const AnalysisConfig& config = *context.config;
    switch (id) {
        case KpiId::kKeywordFrequency:
            return std::make_unique<KeywordFrequencyAccumulator>(config);
        case KpiId::kKeywordDurationImpact:
            return std::make_unique<KeywordDurationAccumulator>(config);
        case KpiId::kLibraryDistribution:
            return std::make_unique<LibraryDistributionAccumulator>();
        case KpiId::kTestComplexity:
            return std::make_unique<TestComplexityAccumulator>(config);
        case KpiId::kAssertionDensity:
            return std::make_unique<AssertionDensityAccumulator>(config);
        case KpiId::kTagCoverage:
            return std::make_unique<TagCoverageAccumulator>(config);
        case KpiId::kErrorPatterns:
            return std::make_unique<ErrorPatternsAccumulator>(config);
        case KpiId::kRedundancyDetection:
            return std::make_unique<RedundancyAccumulator>(config);
        case KpiId::kSourceTestStats:
            return std::make_unique<SourceTestStatsAccumulator>(
                context.source_browser, config, context.repository_id);
        case KpiId::kSourceLibraryDistribution:
            return std::make_unique<SourceLibraryAccumulator>(
                context.source_browser, config, context.repository_id);
        case KpiId::kTestPassRateTrend:
            return std::make_unique<PassRateTrendAccumulator>(config);
        case KpiId::kSlowestTests:
            return std::make_unique<SlowestTestsAccumulator>(config);
        case KpiId::kFlakinessScore:
            return std::make_unique<FlakinessScoreAccumulator>(config);
        case KpiId::kFailureHeatmap:
            return std::make_unique<FailureHeatmapAccumulator>(config);
        case KpiId::kSuiteDurationTreemap:
            return std::make_unique<SuiteDurationAccumulator>(config);
    }
    return nullptr;
}

}  // namespace runlens::analytics
