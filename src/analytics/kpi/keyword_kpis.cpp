/// @file keyword_kpis.cpp
/// @brief Keyword usage KPI accumulators

#include "analytics/kpi/keyword_kpis.h"

#include <algorithm>
#include <vector>

#include "analytics/keyword_library.h"
#include "analytics/stats_util.h"

namespace runlens::analytics {

using json = nlohmann::json;

std::string KeywordUsageAccumulator::Usage::Library() const {
    const std::pair<const std::string, int64_t>* best = nullptr;
    for (const auto& entry : libraries) {
        if (!best || entry.second > best->second) {
            best = &entry;
        }
    }
    return best ? best->first : std::string(kUnknownLibrary);
}

void KeywordUsageAccumulator::Fold(const ReportData& report) {
    for (const auto& call : report.keywords) {
        Usage& usage = usage_[call.keyword_name];
        ++usage.calls;
        usage.total_duration += call.duration_seconds;
        ++usage.libraries[ResolveCallLibrary(call)];
        ++total_calls_;
    }
}

absl::StatusOr<json> KeywordFrequencyAccumulator::Finalize() {
    std::vector<const std::pair<const std::string, Usage>*> ranked;
    for (const auto& entry : usage_) {
        ranked.push_back(&entry);
    }
    // usage_ is name-ordered; stable sort keeps name asc on ties
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        return a->second.calls > b->second.calls;
    });

    json top = json::array();
    for (size_t i = 0; i < ranked.size() && i < config_.keyword_frequency_top; ++i) {
        const auto& [name, usage] = *ranked[i];
        top.push_back({
            {"name", name},
            {"library", usage.Library()},
            {"count", usage.calls},
            {"percentage", Percentage(static_cast<double>(usage.calls),
                                      static_cast<double>(total_calls_))},
        });
    }
    return json{
        {"total_calls", total_calls_},
        {"unique_keywords", usage_.size()},
        {"top_keywords", std::move(top)},
    };
}

absl::StatusOr<json> KeywordDurationAccumulator::Finalize() {
    std::vector<const std::pair<const std::string, Usage>*> ranked;
    for (const auto& entry : usage_) {
        ranked.push_back(&entry);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        return a->second.total_duration > b->second.total_duration;
    });

    json top = json::array();
    for (size_t i = 0; i < ranked.size() && i < config_.duration_impact_top; ++i) {
        const auto& [name, usage] = *ranked[i];
        top.push_back({
            {"name", name},
            {"library", usage.Library()},
            {"total_duration", RoundTo(usage.total_duration, 2)},
            {"avg_duration", usage.calls ? RoundTo(usage.total_duration / usage.calls, 2) : 0.0},
            {"calls", usage.calls},
        });
    }
    return json{{"top_by_duration", std::move(top)}};
}

void LibraryDistributionAccumulator::Fold(const ReportData& report) {
    for (const auto& call : report.keywords) {
        Share& share = libraries_[ResolveCallLibrary(call)];
        ++share.calls;
        share.total_duration += call.duration_seconds;
        ++total_calls_;
    }
}

absl::StatusOr<json> LibraryDistributionAccumulator::Finalize() {
    std::vector<const std::pair<const std::string, Share>*> ranked;
    for (const auto& entry : libraries_) {
        ranked.push_back(&entry);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        return a->second.calls > b->second.calls;
    });

    json libraries = json::array();
    for (const auto* entry : ranked) {
        libraries.push_back({
            {"library", entry->first},
            {"count", entry->second.calls},
            {"percentage", Percentage(static_cast<double>(entry->second.calls),
                                      static_cast<double>(total_calls_))},
            {"total_duration", RoundTo(entry->second.total_duration, 2)},
        });
    }
    return json{
        {"total_calls", total_calls_},
        {"libraries", std::move(libraries)},
    };
}

}  // namespace runlens::analytics
