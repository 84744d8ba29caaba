/// @file error_patterns.cpp
/// @brief Error message normalization and clustering

#include "analytics/error_patterns.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

namespace runlens::analytics {

namespace {

absl::StatusOr<std::regex> CompileRule(const ErrorNormalizationRule& rule) {
    try {
        return std::regex(rule.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid error normalization pattern '", rule.pattern, "': ", e.what()));
    }
}

}  // namespace

absl::StatusOr<std::unique_ptr<ErrorPatternClusterer>> ErrorPatternClusterer::Create(
    const std::vector<ErrorNormalizationRule>& rules, size_t max_length) {
    std::vector<std::pair<std::regex, std::string>> compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        auto re = CompileRule(rule);
        if (!re.ok()) {
            return re.status();
        }
        compiled.emplace_back(std::move(*re), rule.replacement);
    }
    return std::unique_ptr<ErrorPatternClusterer>(
        new ErrorPatternClusterer(std::move(compiled), max_length));
}

absl::Status ErrorPatternClusterer::ValidateRules(
    const std::vector<ErrorNormalizationRule>& rules) {
    for (const auto& rule : rules) {
        auto re = CompileRule(rule);
        if (!re.ok()) {
            return re.status();
        }
    }
    return absl::OkStatus();
}

ErrorPatternClusterer::ErrorPatternClusterer(
    std::vector<std::pair<std::regex, std::string>> rules, size_t max_length)
    : rules_(std::move(rules)), max_length_(max_length) {}

std::string ErrorPatternClusterer::Normalize(std::string_view message) const {
    std::string text(message);
    for (const auto& [re, replacement] : rules_) {
        text = std::regex_replace(text, re, replacement);
    }

    // Collapse whitespace runs to one space
    std::string collapsed;
    collapsed.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (absl::ascii_isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !collapsed.empty()) {
            collapsed.push_back(' ');
        }
        in_space = false;
        collapsed.push_back(c);
    }

    if (collapsed.size() > max_length_) {
        collapsed.resize(max_length_);
    }
    return collapsed;
}

void ErrorPatternClusterer::Add(const std::string& test_name, std::string_view message) {
    if (absl::StripAsciiWhitespace(message).empty()) {
        return;
    }
    Bucket& bucket = buckets_[Normalize(message)];
    ++bucket.count;
    bucket.tests.insert(test_name);
    ++total_errors_;
}

ErrorPatternSummary ErrorPatternClusterer::Summarize(size_t max_patterns,
                                                     size_t max_examples) const {
    ErrorPatternSummary summary;
    summary.total_errors = total_errors_;
    summary.unique_patterns = buckets_.size();

    std::vector<const std::pair<const std::string, Bucket>*> ranked;
    ranked.reserve(buckets_.size());
    for (const auto& entry : buckets_) {
        ranked.push_back(&entry);
    }
    // buckets_ is already ordered by pattern, so a stable sort keeps pattern asc on ties
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        return a->second.count > b->second.count;
    });

    for (size_t i = 0; i < ranked.size() && i < max_patterns; ++i) {
        ErrorPattern pattern;
        pattern.pattern = ranked[i]->first;
        pattern.count = ranked[i]->second.count;
        for (const auto& test : ranked[i]->second.tests) {
            if (pattern.example_tests.size() >= max_examples) {
                break;
            }
            pattern.example_tests.push_back(test);
        }
        summary.patterns.push_back(std::move(pattern));
    }
    return summary;
}

}  // namespace runlens::analytics
