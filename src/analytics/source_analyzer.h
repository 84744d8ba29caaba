#pragma once

/// @file source_analyzer.h
/// @brief Static metrics over a repository's test sources

#include <memory>
#include <optional>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analytics/kpi/analysis_config.h"
#include "model/types.h"
#include "storage/source_browser.h"

namespace runlens::analytics {

/// @brief Computes the source_test_stats and source_library_distribution KPIs
///
/// Works on source files only, no run data. Without a repository (or without
/// a browser) both KPIs are zeroed.
class SourceAnalyzer {
public:
    SourceAnalyzer(std::shared_ptr<storage::SourceBrowser> browser, const AnalysisConfig& config);

    absl::StatusOr<nlohmann::json> TestStats(std::optional<RepositoryId> repository_id) const;

    absl::StatusOr<nlohmann::json> LibraryDistribution(
        std::optional<RepositoryId> repository_id) const;

    /// @brief {total_files, total_tests, lines/steps stats, step_histogram,
    /// top_keywords, files}
    static nlohmann::json SummarizeTests(const std::vector<storage::SourceTestFile>& files,
                                         const AnalysisConfig& config);

    /// @brief {total_libraries, libraries[{library, file_count, percentage, files}]}
    static nlohmann::json SummarizeLibraries(const std::vector<storage::LibraryImport>& imports,
                                             const AnalysisConfig& config);

private:
    std::shared_ptr<storage::SourceBrowser> browser_;
    const AnalysisConfig& config_;
};

}  // namespace runlens::analytics
