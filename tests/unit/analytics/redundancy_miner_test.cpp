/// @file redundancy_miner_test.cpp
/// @brief Tests for shared keyword sequence mining

#include <gtest/gtest.h>

#include "analytics/redundancy_miner.h"

namespace runlens::analytics {
namespace {

using Steps = std::vector<std::string>;

TEST(RedundancyMinerTest, FindsSequenceSharedByThreeTests) {
    RedundancyMiner miner;
    miner.AddTest("A", {"Open", "Login", "Check", "Close"});
    miner.AddTest("B", {"Open", "Login", "Check", "Logout"});
    miner.AddTest("C", {"Prepare", "Open", "Login", "Check"});

    auto summary = miner.Mine();
    EXPECT_EQ(summary.total_shared_sequences, 1u);
    ASSERT_EQ(summary.sequences.size(), 1u);
    EXPECT_EQ(summary.sequences[0].keywords, (Steps{"Open", "Login", "Check"}));
    EXPECT_EQ(summary.sequences[0].length, 3);
    EXPECT_EQ(summary.sequences[0].occurrence_count, 3);
    EXPECT_EQ(summary.sequences[0].tests, (Steps{"A", "B", "C"}));
}

TEST(RedundancyMinerTest, RepeatsInsideOneTestCountOnce) {
    RedundancyMiner miner;
    miner.AddTest("A", {"a", "b", "c", "a", "b", "c"});
    miner.AddTest("B", {"a", "b", "c"});

    auto summary = miner.Mine();
    ASSERT_EQ(summary.sequences.size(), 1u);
    EXPECT_EQ(summary.sequences[0].occurrence_count, 2);
}

TEST(RedundancyMinerTest, SingleTestSharesNothing) {
    RedundancyMiner miner;
    miner.AddTest("A", {"a", "b", "c", "a", "b", "c"});
    EXPECT_EQ(miner.Mine().total_shared_sequences, 0u);
}

TEST(RedundancyMinerTest, ShortTestsAreIgnored) {
    RedundancyMiner miner;
    miner.AddTest("A", {"a", "b"});
    miner.AddTest("B", {"a", "b"});
    EXPECT_TRUE(miner.Mine().sequences.empty());
}

TEST(RedundancyMinerTest, SameNameReplacesSteps) {
    RedundancyMiner miner;
    miner.AddTest("A", {"a", "b", "c"});
    miner.AddTest("A", {"x", "y", "z"});
    miner.AddTest("B", {"a", "b", "c"});
    EXPECT_EQ(miner.TestCount(), 2u);
    EXPECT_TRUE(miner.Mine().sequences.empty());
}

TEST(RedundancyMinerTest, OrderingAndLimits) {
    RedundancyMinerConfig config;
    config.max_sequences = 2;
    config.max_tests = 2;
    RedundancyMiner miner(config);
    miner.AddTest("A", {"p", "q", "r", "s"});
    miner.AddTest("B", {"p", "q", "r", "s"});
    miner.AddTest("C", {"x", "y", "z"});
    miner.AddTest("D", {"x", "y", "z"});
    miner.AddTest("E", {"x", "y", "z"});

    auto summary = miner.Mine();
    // xyz, pqrs, pqr, qrs
    EXPECT_EQ(summary.total_shared_sequences, 4u);
    ASSERT_EQ(summary.sequences.size(), 2u);
    EXPECT_EQ(summary.sequences[0].keywords, (Steps{"x", "y", "z"}));
    EXPECT_EQ(summary.sequences[0].occurrence_count, 3);
    EXPECT_EQ(summary.sequences[0].tests, (Steps{"C", "D"}));
    EXPECT_EQ(summary.sequences[1].keywords, (Steps{"p", "q", "r", "s"}));
}

TEST(RedundancyMinerTest, ValidateConfig) {
    EXPECT_TRUE(RedundancyMiner::ValidateConfig({}).ok());
    EXPECT_TRUE(absl::IsInvalidArgument(RedundancyMiner::ValidateConfig({1, 5, 20, 10})));
    EXPECT_TRUE(absl::IsInvalidArgument(RedundancyMiner::ValidateConfig({4, 3, 20, 10})));
    EXPECT_TRUE(RedundancyMiner::ValidateConfig({2, 2, 20, 10}).ok());
}

}  // namespace
}  // namespace runlens::analytics
