/// @file source_analyzer.cpp
/// @brief Static test source statistics

#include "analytics/source_analyzer.h"

#include <algorithm>
#include <climits>
#include <map>
#include <set>

#include "analytics/keyword_library.h"
#include "analytics/stats_util.h"

namespace runlens::analytics {

using json = nlohmann::json;

SourceAnalyzer::SourceAnalyzer(std::shared_ptr<storage::SourceBrowser> browser,
                               const AnalysisConfig& config)
    : browser_(std::move(browser)), config_(config) {}

absl::StatusOr<json> SourceAnalyzer::TestStats(std::optional<RepositoryId> repository_id) const {
    if (!repository_id || !browser_) {
        return SummarizeTests({}, config_);
    }
    auto files = browser_->ListTestFiles(*repository_id);
    if (!files.ok()) {
        return files.status();
    }
    return SummarizeTests(*files, config_);
}

absl::StatusOr<json> SourceAnalyzer::LibraryDistribution(
    std::optional<RepositoryId> repository_id) const {
    if (!repository_id || !browser_) {
        return SummarizeLibraries({}, config_);
    }
    auto imports = browser_->ListLibraryImports(*repository_id);
    if (!imports.ok()) {
        return imports.status();
    }
    return SummarizeLibraries(*imports, config_);
}

json SourceAnalyzer::SummarizeTests(const std::vector<storage::SourceTestFile>& files,
                                    const AnalysisConfig& config) {
    const auto labels = HistogramLabels(config.histogram_bounds);
    std::vector<int64_t> histogram(labels.size(), 0);

    int64_t total_tests = 0;
    int64_t line_sum = 0;
    int64_t step_sum = 0;
    int min_lines = INT_MAX, max_lines = 0, min_steps = INT_MAX, max_steps = 0;
    std::map<std::string, int64_t> keyword_counts;
    int64_t keyword_calls = 0;

    struct FileSummary {
        std::string path;
        int64_t test_count = 0;
        int64_t total_steps = 0;
    };
    std::vector<FileSummary> summaries;

    for (const auto& file : files) {
        if (file.tests.empty()) {
            continue;
        }
        FileSummary summary{file.path, 0, 0};
        for (const auto& test : file.tests) {
            const int steps = static_cast<int>(test.steps.size());
            ++total_tests;
            line_sum += test.line_count;
            step_sum += steps;
            min_lines = std::min(min_lines, test.line_count);
            max_lines = std::max(max_lines, test.line_count);
            min_steps = std::min(min_steps, steps);
            max_steps = std::max(max_steps, steps);
            ++histogram[HistogramBucket(config.histogram_bounds, steps)];
            for (const auto& step : test.steps) {
                ++keyword_counts[step];
                ++keyword_calls;
            }
            ++summary.test_count;
            summary.total_steps += steps;
        }
        summaries.push_back(std::move(summary));
    }

    json out;
    out["total_files"] = summaries.size();
    out["total_tests"] = total_tests;
    out["avg_lines"] = Mean1(static_cast<double>(line_sum), total_tests);
    out["min_lines"] = total_tests ? min_lines : 0;
    out["max_lines"] = max_lines;
    out["avg_steps"] = Mean1(static_cast<double>(step_sum), total_tests);
    out["min_steps"] = total_tests ? min_steps : 0;
    out["max_steps"] = max_steps;

    json hist = json::array();
    for (size_t i = 0; i < labels.size(); ++i) {
        hist.push_back({{"bucket", labels[i]}, {"count", histogram[i]}});
    }
    out["step_histogram"] = std::move(hist);

    std::vector<std::pair<std::string, int64_t>> ranked(keyword_counts.begin(),
                                                        keyword_counts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    json top = json::array();
    for (size_t i = 0; i < ranked.size() && i < config.source_keywords_top; ++i) {
        top.push_back({
            {"name", ranked[i].first},
            {"count", ranked[i].second},
            {"percentage", Percentage(static_cast<double>(ranked[i].second),
                                      static_cast<double>(keyword_calls))},
            {"library", ResolveLibrary(ranked[i].first)},
        });
    }
    out["top_keywords"] = std::move(top);

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const FileSummary& a, const FileSummary& b) {
                         if (a.test_count != b.test_count) {
                             return a.test_count > b.test_count;
                         }
                         return a.path < b.path;
                     });
    json file_list = json::array();
    for (size_t i = 0; i < summaries.size() && i < config.source_files_top; ++i) {
        const auto& s = summaries[i];
        file_list.push_back({
            {"path", s.path},
            {"test_count", s.test_count},
            {"total_steps", s.total_steps},
            {"avg_steps", Mean1(static_cast<double>(s.total_steps), s.test_count)},
        });
    }
    out["files"] = std::move(file_list);
    return out;
}

json SourceAnalyzer::SummarizeLibraries(const std::vector<storage::LibraryImport>& imports,
                                        const AnalysisConfig& config) {
    std::set<std::string> files_with_imports;
    for (const auto& lib : imports) {
        files_with_imports.insert(lib.files.begin(), lib.files.end());
    }

    std::vector<const storage::LibraryImport*> ranked;
    for (const auto& lib : imports) {
        ranked.push_back(&lib);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        if (a->files.size() != b->files.size()) {
            return a->files.size() > b->files.size();
        }
        return a->library_name < b->library_name;
    });

    json libraries = json::array();
    for (const auto* lib : ranked) {
        std::vector<std::string> sample(
            lib->files.begin(),
            lib->files.begin() + std::min(lib->files.size(), config.source_library_files));
        libraries.push_back({
            {"library", lib->library_name},
            {"file_count", lib->files.size()},
            {"percentage", Percentage(static_cast<double>(lib->files.size()),
                                      static_cast<double>(files_with_imports.size()))},
            {"files", sample},
        });
    }

    return json{
        {"total_libraries", imports.size()},
        {"libraries", std::move(libraries)},
    };
}

}  // namespace runlens::analytics
