#pragma once

/// @file error_patterns.h
/// @brief Clusters failure messages by their normalized shape

#include <cstdint>
#include <map>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "analytics/kpi/analysis_config.h"

namespace runlens::analytics {

/// @brief A group of failures sharing one normalized message
struct ErrorPattern {
    std::string pattern;
    int64_t count = 0;
    std::vector<std::string> example_tests;   ///< Sorted, distinct
};

/// @brief Clustering output
struct ErrorPatternSummary {
    int64_t total_errors = 0;
    size_t unique_patterns = 0;
    std::vector<ErrorPattern> patterns;       ///< count desc, pattern asc
};

/// @brief Failure message clusterer
///
/// Messages are rewritten by an ordered rule chain so that variable parts
/// (numbers, paths, quoted values) collapse into placeholders, e.g.
/// "Timeout after 30 s waiting for '#login'" and
/// "Timeout after 45 s waiting for '#submit'" both become
/// "Timeout after <N> s waiting for <str>". Whitespace is then collapsed and
/// the result truncated.
///
/// Example usage:
/// @code
///   auto clusterer = ErrorPatternClusterer::Create(DefaultErrorRules());
///   (*clusterer)->Add("Login Works", "Element 'id=user' not found after 10 s");
///   auto summary = (*clusterer)->Summarize(20, 5);
/// @endcode
class ErrorPatternClusterer {
public:
    /// @brief Compile the rules; InvalidArgument for a malformed regex
    static absl::StatusOr<std::unique_ptr<ErrorPatternClusterer>> Create(
        const std::vector<ErrorNormalizationRule>& rules, size_t max_length = 200);

    /// @brief Check that every rule compiles
    static absl::Status ValidateRules(const std::vector<ErrorNormalizationRule>& rules);

    /// @brief Apply the rule chain to one message
    std::string Normalize(std::string_view message) const;

    /// @brief Record one failure; empty messages are ignored
    void Add(const std::string& test_name, std::string_view message);

    /// @brief Top patterns with up to @p max_examples example tests each
    ErrorPatternSummary Summarize(size_t max_patterns, size_t max_examples) const;

private:
    ErrorPatternClusterer(std::vector<std::pair<std::regex, std::string>> rules,
                          size_t max_length);

    struct Bucket {
        int64_t count = 0;
        std::set<std::string> tests;
    };

    std::vector<std::pair<std::regex, std::string>> rules_;
    size_t max_length_;
    std::map<std::string, Bucket> buckets_;
    int64_t total_errors_ = 0;
};

}  // namespace runlens::analytics
