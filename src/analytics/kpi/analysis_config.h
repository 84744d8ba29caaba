#pragma once

/// @file analysis_config.h
/// @brief Tunables of the deep-analysis KPIs

#include <cstddef>
#include <string>
#include <vector>

namespace runlens::analytics {

/// @brief One regex rewrite applied to failure messages
struct ErrorNormalizationRule {
    std::string pattern;       ///< ECMAScript regex
    std::string replacement;
};

/// @brief Default rewrite chain: timestamps, paths, quoted strings, robot
/// variables, hex literals, numbers (in that order)
std::vector<ErrorNormalizationRule> DefaultErrorRules();

/// @brief Labels for a step histogram, e.g. {5, 10} -> "0-5", "6-10", "10+"
std::vector<std::string> HistogramLabels(const std::vector<int>& upper_bounds);

/// @brief Index of the histogram bucket holding @p value
size_t HistogramBucket(const std::vector<int>& upper_bounds, int value);

/// @brief Configuration shared by every KPI accumulator
struct AnalysisConfig {
    // Keyword usage
    size_t keyword_frequency_top = 50;
    size_t duration_impact_top = 30;

    // Test quality
    std::vector<int> histogram_bounds = {5, 10, 20, 50};
    size_t complexity_top = 30;
    std::vector<std::string> assertion_words = {"should", "verify", "must"};
    size_t assertion_tests_top = 30;
    size_t no_assertion_top = 20;
    size_t tag_top = 50;

    // Error patterns
    std::vector<ErrorNormalizationRule> error_rules = DefaultErrorRules();
    size_t error_max_length = 200;
    size_t error_patterns_top = 20;
    size_t error_examples = 5;

    // Redundancy
    int redundancy_min_length = 3;
    int redundancy_max_length = 5;
    size_t redundancy_top = 20;
    size_t redundancy_tests = 10;

    // Source analysis
    size_t source_keywords_top = 30;
    size_t source_files_top = 30;
    size_t source_library_files = 10;

    // Execution history
    size_t pass_rate_top = 50;
    size_t slowest_top = 20;
    size_t flakiness_top = 30;
    size_t flakiness_timeline = 20;
    size_t heatmap_tests = 20;
    size_t treemap_top = 30;
};

}  // namespace runlens::analytics
