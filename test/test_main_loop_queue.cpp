// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "native_share/execution/MainLoopQueue.hpp"

using native_share::execution::MainLoopQueue;

TEST(MainLoopQueueTest, TasksRunOnlyWhenPumped) {
    MainLoopQueue queue;
    int value = 0;
    ASSERT_TRUE(queue.post([&value]() { value = 42; }));

    EXPECT_EQ(0, value);
    EXPECT_EQ(1u, queue.pendingCount());
    EXPECT_EQ(1u, queue.runPending());
    EXPECT_EQ(42, value);
    EXPECT_EQ(0u, queue.pendingCount());
}

TEST(MainLoopQueueTest, PreservesPostingOrder) {
    MainLoopQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        queue.post([&order, i]() { order.push_back(i); });
    }
    queue.runPending();
    EXPECT_EQ((std::vector<int>{0, 1, 2, 3, 4}), order);
}

TEST(MainLoopQueueTest, TasksPostedWhileRunningWaitForNextPump) {
    MainLoopQueue queue;
    int runs = 0;
    queue.post([&queue, &runs]() {
        ++runs;
        queue.post([&runs]() { ++runs; });
    });

    EXPECT_EQ(1u, queue.runPending());
    EXPECT_EQ(1, runs);
    EXPECT_EQ(1u, queue.runPending());
    EXPECT_EQ(2, runs);
}

TEST(MainLoopQueueTest, RunForPicksUpTasksFromOtherThreads) {
    MainLoopQueue queue;
    bool ran = false;
    std::thread poster([&queue, &ran]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.post([&ran]() { ran = true; });
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!ran && std::chrono::steady_clock::now() < deadline) {
        queue.runFor(std::chrono::milliseconds(50));
    }
    poster.join();
    EXPECT_TRUE(ran);
}

TEST(MainLoopQueueTest, ThrowingTaskDoesNotStopTheBatch) {
    MainLoopQueue queue;
    bool second_ran = false;
    queue.post([]() { throw std::runtime_error("ui failure"); });
    queue.post([&second_ran]() { second_ran = true; });

    EXPECT_EQ(2u, queue.runPending());
    EXPECT_TRUE(second_ran);
}

TEST(MainLoopQueueTest, CloseDropsPendingAndRejectsNewTasks) {
    MainLoopQueue queue;
    bool ran = false;
    queue.post([&ran]() { ran = true; });
    queue.close();

    EXPECT_EQ(0u, queue.pendingCount());
    EXPECT_FALSE(queue.post([&ran]() { ran = true; }));
    EXPECT_EQ(0u, queue.runPending());
    EXPECT_FALSE(ran);
}
