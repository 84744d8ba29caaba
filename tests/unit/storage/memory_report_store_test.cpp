/// @file memory_report_store_test.cpp
/// @brief Tests for the in-memory report store

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "report_fixtures.h"
#include "storage/memory_report_store.h"

namespace runlens::storage {
namespace {

using fixtures::At;
using fixtures::MakeRun;
using fixtures::MakeStep;
using fixtures::MakeTest;
using json = nlohmann::json;

json SampleDump() {
    return json{
        {"runs", json::array({
            {{"id", 1}, {"repository_id", 1}, {"started_at", "2026-03-01T10:00:00Z"},
             {"finished_at", "2026-03-01T10:05:00Z"}, {"status", "passed"}},
            {{"id", 2}, {"repository_id", 2}, {"started_at", "2026-03-02T10:00:00Z"},
             {"finished_at", "2026-03-02T10:05:00Z"}, {"status", "failed"}},
            {{"id", 3}, {"repository_id", 1}, {"started_at", "2026-03-03T10:00:00Z"},
             {"status", "running"}},
        })},
        {"test_results", json::array({
            {{"run_id", 1}, {"test_name", "Login"}, {"suite_name", "Auth"}, {"status", "PASS"}},
            {{"run_id", 2}, {"test_name", "Login"}, {"suite_name", "Auth"}, {"status", "FAIL"}},
        })},
        {"keyword_calls", json::array({
            {{"run_id", 1}, {"test_name", "Login"}, {"keyword_name", "Click"},
             {"start_time", "2026-03-01T10:00:02Z"}},
            {{"run_id", 1}, {"test_name", "Login"}, {"keyword_name", "Open Browser"},
             {"start_time", "2026-03-01T10:00:01Z"}},
        })},
    };
}

TEST(MemoryReportStoreTest, LoadFromJson) {
    MemoryReportStore store;
    ASSERT_TRUE(store.LoadFromJson(SampleDump()).ok());
    EXPECT_EQ(store.RunCount(), 3u);

    auto results = store.GetTestResults(2);
    ASSERT_TRUE(results.ok());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ((*results)[0].status, TestStatus::kFail);
}

TEST(MemoryReportStoreTest, ListRunsSkipsUnfinishedAndFilters) {
    MemoryReportStore store;
    ASSERT_TRUE(store.LoadFromJson(SampleDump()).ok());

    auto all = store.ListRuns(RunFilter{});
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ((*all)[0].id, 1);
    EXPECT_EQ((*all)[1].id, 2);

    RunFilter repo_filter;
    repo_filter.repository_id = 2;
    auto repo = store.ListRuns(repo_filter);
    ASSERT_TRUE(repo.ok());
    ASSERT_EQ(repo->size(), 1u);
    EXPECT_EQ((*repo)[0].id, 2);
}

TEST(MemoryReportStoreTest, TimeBoundsAreInclusive) {
    MemoryReportStore store;
    store.AddRun(MakeRun(1, 1, At("2026-03-01T00:00:00Z")));
    store.AddRun(MakeRun(2, 1, At("2026-03-01T23:59:59Z")));
    store.AddRun(MakeRun(3, 1, At("2026-03-02T00:00:00Z")));

    RunFilter filter;
    filter.finished_from = At("2026-03-01T00:00:00Z");
    filter.finished_to = At("2026-03-01T23:59:59Z");
    auto runs = store.ListRuns(filter);
    ASSERT_TRUE(runs.ok());
    ASSERT_EQ(runs->size(), 2u);
    EXPECT_EQ((*runs)[1].id, 2);
}

TEST(MemoryReportStoreTest, KeywordCallsOrderedByStartTime) {
    MemoryReportStore store;
    ASSERT_TRUE(store.LoadFromJson(SampleDump()).ok());

    auto calls = store.GetKeywordCalls(1);
    ASSERT_TRUE(calls.ok());
    ASSERT_EQ(calls->size(), 2u);
    EXPECT_EQ((*calls)[0].keyword_name, "Open Browser");
    EXPECT_EQ((*calls)[1].keyword_name, "Click");
}

TEST(MemoryReportStoreTest, OrphanRecordsRejectedWithoutPartialLoad) {
    MemoryReportStore store;
    json dump = SampleDump();
    dump["test_results"].push_back(
        {{"run_id", 99}, {"test_name", "Ghost"}, {"status", "PASS"}});

    EXPECT_TRUE(absl::IsInvalidArgument(store.LoadFromJson(dump)));
    EXPECT_EQ(store.RunCount(), 0u);
}

TEST(MemoryReportStoreTest, AddChildOfUnknownRunIsNotFound) {
    MemoryReportStore store;
    EXPECT_TRUE(absl::IsNotFound(
        store.AddTestResult(MakeTest(5, "Login", "Auth", TestStatus::kPass))));
    EXPECT_TRUE(absl::IsNotFound(
        store.AddKeywordCall(MakeStep(5, "Login", "Click", At("2026-03-01T10:00:00Z")))));
}

TEST(MemoryReportStoreTest, LatestFinishedAt) {
    MemoryReportStore store;
    store.AddRun(MakeRun(1, 1, At("2026-03-01T10:00:00Z")));
    store.AddRun(MakeRun(2, 2, At("2026-03-05T10:00:00Z")));

    auto any = store.LatestFinishedAt(std::nullopt);
    ASSERT_TRUE(any.ok());
    EXPECT_EQ(**any, At("2026-03-05T10:00:00Z"));

    auto repo = store.LatestFinishedAt(1);
    ASSERT_TRUE(repo.ok());
    EXPECT_EQ(**repo, At("2026-03-01T10:00:00Z"));

    auto none = store.LatestFinishedAt(42);
    ASSERT_TRUE(none.ok());
    EXPECT_FALSE(none->has_value());
}

TEST(MemoryReportStoreTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "runlens_store_test.json";
    {
        std::ofstream out(path);
        out << SampleDump().dump();
    }

    MemoryReportStore store;
    ASSERT_TRUE(store.LoadFromFile(path).ok());
    EXPECT_EQ(store.RunCount(), 3u);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    MemoryReportStore broken;
    EXPECT_TRUE(absl::IsInvalidArgument(broken.LoadFromFile(path)));
    std::filesystem::remove(path);

    EXPECT_TRUE(absl::IsNotFound(store.LoadFromFile("/nonexistent/dump.json")));
}

}  // namespace
}  // namespace runlens::storage
