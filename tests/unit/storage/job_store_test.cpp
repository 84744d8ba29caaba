/// @file job_store_test.cpp
/// @brief Tests for the analysis job state machine

#include <gtest/gtest.h>

#include "report_fixtures.h"
#include "storage/job_store.h"

namespace runlens::storage {
namespace {

using fixtures::At;

AnalysisJob NewJob(std::optional<RepositoryId> repository_id = std::nullopt) {
    AnalysisJob job;
    job.repository_id = repository_id;
    job.selected_kpis = {"keyword_frequency"};
    return job;
}

TEST(JobStoreTest, CreateAssignsIdsAndResetsState) {
    JobStore store;
    AnalysisJob job = NewJob();
    job.status = JobStatus::kCompleted;
    job.progress = 80;

    auto first = store.Create(job, At("2026-03-01T10:00:00Z"));
    auto second = store.Create(NewJob(), At("2026-03-01T10:00:00Z"));

    EXPECT_EQ(first.id, 1);
    EXPECT_EQ(second.id, 2);
    EXPECT_EQ(first.status, JobStatus::kPending);
    EXPECT_EQ(first.progress, 0);
    EXPECT_EQ(store.Size(), 2u);
}

TEST(JobStoreTest, UnknownJobIsNotFound) {
    JobStore store;
    EXPECT_TRUE(absl::IsNotFound(store.Get(12).status()));
    EXPECT_TRUE(absl::IsNotFound(store.MarkRunning(12, At("2026-03-01T10:00:00Z"))));
}

TEST(JobStoreTest, FullLifecycle) {
    JobStore store;
    const JobId id = store.Create(NewJob(), At("2026-03-01T10:00:00Z")).id;

    ASSERT_TRUE(store.MarkRunning(id, At("2026-03-01T10:00:01Z")).ok());
    ASSERT_TRUE(store.UpdateProgress(id, 40, 4).ok());
    ASSERT_TRUE(store.Complete(id, {{"keyword_frequency", {{"total_calls", 3}}}}, 10,
                               At("2026-03-01T10:00:05Z")).ok());

    auto job = store.Get(id);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(job->status, JobStatus::kCompleted);
    EXPECT_EQ(job->progress, 100);
    EXPECT_EQ(job->reports_analyzed, 10);
    EXPECT_EQ(job->results["keyword_frequency"]["total_calls"], 3);
    ASSERT_TRUE(job->started_at.has_value());
    ASSERT_TRUE(job->completed_at.has_value());
}

TEST(JobStoreTest, RunningTransitionHappensOnce) {
    JobStore store;
    const JobId id = store.Create(NewJob(), At("2026-03-01T10:00:00Z")).id;

    ASSERT_TRUE(store.MarkRunning(id, At("2026-03-01T10:00:01Z")).ok());
    EXPECT_TRUE(absl::IsFailedPrecondition(store.MarkRunning(id, At("2026-03-01T10:00:02Z"))));
}

TEST(JobStoreTest, ProgressNeverMovesBackwards) {
    JobStore store;
    const JobId id = store.Create(NewJob(), At("2026-03-01T10:00:00Z")).id;

    EXPECT_TRUE(absl::IsFailedPrecondition(store.UpdateProgress(id, 10, 1)));

    ASSERT_TRUE(store.MarkRunning(id, At("2026-03-01T10:00:01Z")).ok());
    ASSERT_TRUE(store.UpdateProgress(id, 50, 5).ok());
    ASSERT_TRUE(store.UpdateProgress(id, 30, 3).ok());
    ASSERT_TRUE(store.UpdateProgress(id, 250, 6).ok());

    auto job = store.Get(id);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(job->progress, 100);
    EXPECT_EQ(job->reports_analyzed, 6);
}

TEST(JobStoreTest, TerminalJobsAreImmutable) {
    JobStore store;
    const JobId id = store.Create(NewJob(), At("2026-03-01T10:00:00Z")).id;
    ASSERT_TRUE(store.MarkRunning(id, At("2026-03-01T10:00:01Z")).ok());
    ASSERT_TRUE(store.UpdateProgress(id, 20, 2).ok());
    ASSERT_TRUE(store.Fail(id, "store unavailable", At("2026-03-01T10:00:02Z")).ok());

    EXPECT_TRUE(absl::IsFailedPrecondition(store.UpdateProgress(id, 90, 9)));
    EXPECT_TRUE(absl::IsFailedPrecondition(
        store.Complete(id, nlohmann::json::object(), 9, At("2026-03-01T10:00:03Z"))));
    EXPECT_TRUE(absl::IsFailedPrecondition(
        store.Fail(id, "again", At("2026-03-01T10:00:03Z"))));

    auto job = store.Get(id);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(job->status, JobStatus::kError);
    EXPECT_EQ(job->error_message, "store unavailable");
    EXPECT_EQ(job->reports_analyzed, 2);
    EXPECT_EQ(job->progress, 20);
}

TEST(JobStoreTest, CompleteRequiresRunning) {
    JobStore store;
    const JobId id = store.Create(NewJob(), At("2026-03-01T10:00:00Z")).id;
    EXPECT_TRUE(absl::IsFailedPrecondition(
        store.Complete(id, nlohmann::json::object(), 0, At("2026-03-01T10:00:01Z"))));
    EXPECT_TRUE(store.Fail(id, "never scheduled", At("2026-03-01T10:00:01Z")).ok());
}

TEST(JobStoreTest, ListMostRecentFirstAndFiltered) {
    JobStore store;
    store.Create(NewJob(1), At("2026-03-01T10:00:00Z"));
    store.Create(NewJob(2), At("2026-03-02T10:00:00Z"));
    store.Create(NewJob(1), At("2026-03-02T10:00:00Z"));

    auto all = store.List(std::nullopt);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 3);
    EXPECT_EQ(all[1].id, 2);
    EXPECT_EQ(all[2].id, 1);

    auto repo = store.List(1);
    ASSERT_EQ(repo.size(), 2u);
    EXPECT_EQ(repo[0].id, 3);
    EXPECT_EQ(repo[1].id, 1);
}

}  // namespace
}  // namespace runlens::storage
