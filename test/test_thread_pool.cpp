// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "native_share/execution/ThreadPool.hpp"

using native_share::execution::ThreadPool;

TEST(ThreadPoolTest, ClampsThreadCountToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(1u, pool.size());
}

TEST(ThreadPoolTest, RunsTasksOffTheCallingThread) {
    ThreadPool pool(2);
    std::promise<std::thread::id> ran_on;
    auto future = ran_on.get_future();

    ASSERT_TRUE(pool.post([&ran_on]() { ran_on.set_value(std::this_thread::get_id()); }));
    ASSERT_EQ(std::future_status::ready, future.wait_for(std::chrono::seconds(5)));
    EXPECT_NE(std::this_thread::get_id(), future.get());
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 50; ++i) {
        pool.post([&counter]() { counter.fetch_add(1); });
    }
    pool.shutdown();
    EXPECT_EQ(50, counter.load());
}

TEST(ThreadPoolTest, RejectsTasksAfterShutdown) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.post([]() {}));
    EXPECT_NO_THROW(pool.shutdown());
}

TEST(ThreadPoolTest, SurvivesThrowingTask) {
    ThreadPool pool(1);
    std::promise<void> done;
    auto future = done.get_future();

    pool.post([]() { throw std::runtime_error("boom"); });
    pool.post([&done]() { done.set_value(); });
    EXPECT_EQ(std::future_status::ready, future.wait_for(std::chrono::seconds(5)));
}

TEST(ThreadPoolTest, EmptyTaskIsRejected) {
    ThreadPool pool(1);
    EXPECT_FALSE(pool.post(nullptr));
}

TEST(ThreadPoolTest, ShutdownFromAnotherThreadWaitsForRunningTask) {
    ThreadPool pool(1);
    std::atomic<bool> finished{false};
    pool.post([&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });

    std::thread stopper([&pool]() { pool.shutdown(); });
    stopper.join();
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(0u, pool.size());
}
