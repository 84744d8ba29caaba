/// @file redundancy_miner.cpp
/// @brief Shared keyword sequence mining

#include "analytics/redundancy_miner.h"

#include <algorithm>
#include <set>

#include <absl/strings/str_cat.h>

namespace runlens::analytics {

RedundancyMiner::RedundancyMiner(RedundancyMinerConfig config) : config_(config) {}

absl::Status RedundancyMiner::ValidateConfig(const RedundancyMinerConfig& config) {
    if (config.min_length < 2) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Redundancy min_length must be at least 2, got ", config.min_length));
    }
    if (config.max_length < config.min_length) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Redundancy max_length ", config.max_length, " is below min_length ",
            config.min_length));
    }
    return absl::OkStatus();
}

void RedundancyMiner::AddTest(const std::string& test_name, std::vector<std::string> steps) {
    tests_[test_name] = std::move(steps);
}

RedundancySummary RedundancyMiner::Mine() const {
    // Sequence -> distinct tests containing it. tests_ iterates in name order,
    // so each set is filled deterministically.
    std::map<std::vector<std::string>, std::set<std::string>> occurrences;
    for (const auto& [name, steps] : tests_) {
        const int n = static_cast<int>(steps.size());
        for (int len = config_.min_length; len <= config_.max_length && len <= n; ++len) {
            for (int start = 0; start + len <= n; ++start) {
                std::vector<std::string> seq(steps.begin() + start, steps.begin() + start + len);
                occurrences[std::move(seq)].insert(name);
            }
        }
    }

    std::vector<SharedSequence> shared;
    for (auto& [seq, tests] : occurrences) {
        if (tests.size() < 2) {
            continue;
        }
        SharedSequence entry;
        entry.keywords = seq;
        entry.length = static_cast<int>(seq.size());
        entry.occurrence_count = static_cast<int64_t>(tests.size());
        for (const auto& test : tests) {
            if (entry.tests.size() >= config_.max_tests) {
                break;
            }
            entry.tests.push_back(test);
        }
        shared.push_back(std::move(entry));
    }

    std::sort(shared.begin(), shared.end(), [](const SharedSequence& a, const SharedSequence& b) {
        if (a.occurrence_count != b.occurrence_count) {
            return a.occurrence_count > b.occurrence_count;
        }
        if (a.length != b.length) {
            return a.length > b.length;
        }
        return a.keywords < b.keywords;
    });

    RedundancySummary summary;
    summary.total_shared_sequences = shared.size();
    if (shared.size() > config_.max_sequences) {
        shared.resize(config_.max_sequences);
    }
    summary.sequences = std::move(shared);
    return summary;
}

}  // namespace runlens::analytics
