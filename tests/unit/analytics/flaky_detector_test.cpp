/// @file flaky_detector_test.cpp
/// @brief Tests for flaky test detection

#include <gtest/gtest.h>

#include <memory>

#include "analytics/flaky_detector.h"
#include "report_fixtures.h"
#include "storage/memory_report_store.h"

namespace runlens::analytics {
namespace {

using fixtures::At;
using fixtures::MakeRun;
using fixtures::MakeTest;

constexpr TestStatus P = TestStatus::kPass;
constexpr TestStatus F = TestStatus::kFail;
constexpr TestStatus S = TestStatus::kSkip;

TEST(CountFlipsTest, Basic) {
    EXPECT_EQ(CountFlips({}), 0);
    EXPECT_EQ(CountFlips({P, P, P}), 0);
    EXPECT_EQ(CountFlips({P, F, P}), 2);
    EXPECT_EQ(CountFlips({F, F, P, F}), 2);
}

TEST(CountFlipsTest, SkipIsTransparent) {
    EXPECT_EQ(CountFlips({P, S, P}), 0);
    EXPECT_EQ(CountFlips({P, S, F}), 1);
    EXPECT_EQ(CountFlips({S, S}), 0);
}

class FlakyDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Runs are inserted out of chronological order on purpose
        runs_ = {
            MakeRun(3, 1, At("2026-03-03T10:00:00Z")),
            MakeRun(1, 1, At("2026-03-01T10:00:00Z")),
            MakeRun(2, 1, At("2026-03-02T10:00:00Z")),
            MakeRun(4, 1, At("2026-03-04T10:00:00Z")),
        };
    }

    std::vector<RunRecord> runs_;
};

TEST_F(FlakyDetectorTest, OrdersByRunFinishTime) {
    // Chronological: PASS FAIL PASS FAIL -> 3 flips
    std::vector<TestResult> results = {
        MakeTest(3, "Login", "Auth", P),
        MakeTest(1, "Login", "Auth", P),
        MakeTest(4, "Login", "Auth", F),
        MakeTest(2, "Login", "Auth", F),
    };

    FlakyTestDetector detector(nullptr);
    auto flaky = detector.Detect(runs_, results);
    ASSERT_EQ(flaky.size(), 1u);
    EXPECT_EQ(flaky[0].test_name, "Login");
    EXPECT_EQ(flaky[0].suite_name, "Auth");
    EXPECT_EQ(flaky[0].flip_count, 3);
    EXPECT_EQ(flaky[0].total_runs, 4);
    EXPECT_EQ(flaky[0].pass_count, 2);
    EXPECT_EQ(flaky[0].fail_count, 2);
    EXPECT_DOUBLE_EQ(flaky[0].flaky_rate, 50.0);
    EXPECT_EQ(flaky[0].last_status, F);
}

TEST_F(FlakyDetectorTest, StableTestsAreNotFlaky) {
    std::vector<TestResult> results = {
        MakeTest(1, "Always", "S", P), MakeTest(2, "Always", "S", P),
        MakeTest(3, "Broken", "S", F), MakeTest(4, "Broken", "S", F),
        MakeTest(1, "Skipped", "S", S), MakeTest(2, "Skipped", "S", P),
    };
    FlakyTestDetector detector(nullptr);
    EXPECT_TRUE(detector.Detect(runs_, results).empty());
}

TEST_F(FlakyDetectorTest, SameNameInDifferentSuitesIsDistinct) {
    std::vector<TestResult> results = {
        MakeTest(1, "Smoke", "A", P), MakeTest(2, "Smoke", "B", F),
        MakeTest(3, "Smoke", "A", P), MakeTest(4, "Smoke", "B", F),
    };
    FlakyTestDetector detector(nullptr);
    EXPECT_TRUE(detector.Detect(runs_, results).empty());
}

TEST_F(FlakyDetectorTest, MinRunsThreshold) {
    std::vector<TestResult> results = {
        MakeTest(1, "Short", "S", P),
        MakeTest(2, "Short", "S", F),
    };

    FlakyTestDetector lenient(nullptr, FlakyDetectorConfig{2});
    EXPECT_EQ(lenient.Detect(runs_, results).size(), 1u);

    FlakyTestDetector strict(nullptr, FlakyDetectorConfig{3});
    EXPECT_TRUE(strict.Detect(runs_, results).empty());
}

TEST_F(FlakyDetectorTest, ResultsOfUnknownRunsAreIgnored) {
    std::vector<TestResult> results = {
        MakeTest(1, "T", "S", P),
        MakeTest(99, "T", "S", F),
    };
    FlakyTestDetector detector(nullptr);
    EXPECT_TRUE(detector.Detect(runs_, results).empty());
}

TEST_F(FlakyDetectorTest, SortedByFlipsThenRateThenName) {
    std::vector<TestResult> results = {
        // 3 flips
        MakeTest(1, "Wobbly", "S", P), MakeTest(2, "Wobbly", "S", F),
        MakeTest(3, "Wobbly", "S", P), MakeTest(4, "Wobbly", "S", F),
        // 1 flip, 25% pass
        MakeTest(1, "Mostly Red", "S", P), MakeTest(2, "Mostly Red", "S", F),
        MakeTest(3, "Mostly Red", "S", F), MakeTest(4, "Mostly Red", "S", F),
        // 1 flip, 75% pass
        MakeTest(1, "Mostly Green", "S", P), MakeTest(2, "Mostly Green", "S", P),
        MakeTest(3, "Mostly Green", "S", P), MakeTest(4, "Mostly Green", "S", F),
        // 1 flip, 75% pass, sorts after "Mostly Green"
        MakeTest(1, "Nearly Green", "S", P), MakeTest(2, "Nearly Green", "S", P),
        MakeTest(3, "Nearly Green", "S", P), MakeTest(4, "Nearly Green", "S", F),
    };

    FlakyTestDetector detector(nullptr);
    auto flaky = detector.Detect(runs_, results);
    ASSERT_EQ(flaky.size(), 4u);
    EXPECT_EQ(flaky[0].test_name, "Wobbly");
    EXPECT_EQ(flaky[1].test_name, "Mostly Red");
    EXPECT_EQ(flaky[2].test_name, "Mostly Green");
    EXPECT_EQ(flaky[3].test_name, "Nearly Green");
}

TEST(FlakyDetectorStoreTest, DetectFlakyUsesWindow) {
    auto store = std::make_shared<storage::MemoryReportStore>();
    store->AddRun(MakeRun(1, 1, At("2026-01-01T10:00:00Z")));  // outside 7 days
    store->AddRun(MakeRun(2, 1, At("2026-03-08T10:00:00Z")));
    store->AddRun(MakeRun(3, 1, At("2026-03-09T10:00:00Z")));
    store->AddRun(MakeRun(4, 2, At("2026-03-09T11:00:00Z")));
    ASSERT_TRUE(store->AddTestResult(MakeTest(1, "T", "S", F)).ok());
    ASSERT_TRUE(store->AddTestResult(MakeTest(2, "T", "S", P)).ok());
    ASSERT_TRUE(store->AddTestResult(MakeTest(3, "T", "S", F)).ok());
    ASSERT_TRUE(store->AddTestResult(MakeTest(4, "T", "S", P)).ok());

    FlakyTestDetector detector(store);
    const Timestamp now = At("2026-03-10T00:00:00Z");

    auto all = detector.DetectFlaky(7, std::nullopt, now);
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all->size(), 1u);
    EXPECT_EQ((*all)[0].total_runs, 3);
    EXPECT_EQ((*all)[0].flip_count, 2);

    auto repo1 = detector.DetectFlaky(7, RepositoryId{1}, now);
    ASSERT_TRUE(repo1.ok());
    ASSERT_EQ(repo1->size(), 1u);
    EXPECT_EQ((*repo1)[0].flip_count, 1);

    EXPECT_EQ(detector.DetectFlaky(0, std::nullopt, now).status().code(),
              absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace runlens::analytics
