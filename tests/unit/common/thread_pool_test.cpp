/// @file thread_pool_test.cpp
/// @brief Tests for the analysis worker pool

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "common/thread_pool.h"

namespace runlens {
namespace {

TEST(ThreadPoolTest, RunsEveryQueuedTask) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.Execute([&counter]() {
            counter.fetch_add(1, std::memory_order_relaxed);
        }).ok());
    }
    pool.Wait();

    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, WaitBlocksUntilIdle) {
    ThreadPool pool(2, "analysis");
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.Execute([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            counter.fetch_add(1);
        }).ok());
    }
    pool.Wait();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.PendingTasks(), 0u);
    EXPECT_EQ(pool.Name(), "analysis");
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool(1);
    std::atomic<bool> ran{false};

    ASSERT_TRUE(pool.Execute([]() { throw std::runtime_error("boom"); }).ok());
    ASSERT_TRUE(pool.Execute([&ran]() { ran = true; }).ok());
    pool.Wait();

    EXPECT_TRUE(ran.load());
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewTasks) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pool.Execute([&counter]() { counter.fetch_add(1); }).ok());
    }

    pool.Shutdown();
    EXPECT_EQ(counter.load(), 5);

    auto status = pool.Execute([&counter]() { counter.fetch_add(1); });
    EXPECT_TRUE(absl::IsUnavailable(status));
    EXPECT_EQ(counter.load(), 5);

    pool.Shutdown();
}

TEST(ThreadPoolTest, Size) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.Size(), 3u);

    ThreadPool automatic;
    EXPECT_GT(automatic.Size(), 0u);
}

}  // namespace
}  // namespace runlens
