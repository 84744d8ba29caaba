/// @file analysis_config.cpp
/// @brief Default normalization rules and histogram bucketing

#include "analytics/kpi/analysis_config.h"

#include <absl/strings/str_cat.h>

namespace runlens::analytics {

std::vector<ErrorNormalizationRule> DefaultErrorRules() {
    return {
        {R"(\b\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}[^\s]*)", "<ts>"},
        {R"([A-Za-z]:\\[^\s]+|/[^\s]+)", "<path>"},
        {R"('[^']*'|"[^"]*")", "<str>"},
        {R"([$@&%]\{[^}]*\})", "<var>"},
        {R"(\b0[xX][0-9a-fA-F]+\b)", "<hex>"},
        {R"(\b\d+(\.\d+)?)", "<N>"},
    };
}

std::vector<std::string> HistogramLabels(const std::vector<int>& upper_bounds) {
    std::vector<std::string> labels;
    int lower = 0;
    for (int bound : upper_bounds) {
        labels.push_back(absl::StrCat(lower, "-", bound));
        lower = bound + 1;
    }
    labels.push_back(absl::StrCat(upper_bounds.empty() ? 0 : upper_bounds.back(), "+"));
    return labels;
}

size_t HistogramBucket(const std::vector<int>& upper_bounds, int value) {
    for (size_t i = 0; i < upper_bounds.size(); ++i) {
        if (value <= upper_bounds[i]) {
            return i;
        }
    }
    return upper_bounds.size();
}

}  // namespace runlens::analytics
