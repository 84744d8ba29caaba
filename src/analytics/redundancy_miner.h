#pragma once

/// @file redundancy_miner.h
/// @brief Finds keyword sequences repeated across tests

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <absl/status/status.h>

namespace runlens::analytics {

/// @brief Contiguous step sequence found in several tests
struct SharedSequence {
    std::vector<std::string> keywords;
    int length = 0;
    int64_t occurrence_count = 0;       ///< Distinct tests containing it
    std::vector<std::string> tests;     ///< Sorted sample of those tests
};

struct RedundancySummary {
    size_t total_shared_sequences = 0;
    std::vector<SharedSequence> sequences;
};

struct RedundancyMinerConfig {
    int min_length = 3;
    int max_length = 5;
    size_t max_sequences = 20;
    size_t max_tests = 10;
};

/// @brief Redundancy miner
///
/// Every contiguous subsequence of a test's steps with a length in
/// [min_length, max_length] is counted once per distinct test name. A
/// sequence is reported when at least two tests share it. Results are
/// ordered by occurrence count desc, length desc, then keywords asc.
class RedundancyMiner {
public:
    explicit RedundancyMiner(RedundancyMinerConfig config = {});

    /// @brief InvalidArgument unless 2 <= min_length <= max_length
    static absl::Status ValidateConfig(const RedundancyMinerConfig& config);

    /// @brief Set the step list of a test; a repeated name replaces the earlier list
    void AddTest(const std::string& test_name, std::vector<std::string> steps);

    size_t TestCount() const { return tests_.size(); }

    RedundancySummary Mine() const;

private:
    RedundancyMinerConfig config_;
    std::map<std::string, std::vector<std::string>> tests_;
};

}  // namespace runlens::analytics
