// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/execution/MainLoopQueue.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace native_share::execution {

namespace {

void runTask(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "Error: UI task threw exception: " << e.what() << std::endl;
    }
}

}  // namespace

bool MainLoopQueue::post(Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
    return true;
}

std::size_t MainLoopQueue::runPending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }
    for (const auto& task : batch) {
        runTask(task);
    }
    return batch.size();
}

std::size_t MainLoopQueue::runFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t executed = 0;
    for (;;) {
        executed += runPending();

        std::unique_lock<std::mutex> lock(mutex_);
        const bool has_work = cv_.wait_until(lock, deadline, [this]() {
            return closed_ || !tasks_.empty();
        });
        if (!has_work || closed_) {
            return executed;
        }
    }
}

void MainLoopQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        tasks_.clear();
    }
    cv_.notify_all();
}

std::size_t MainLoopQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace native_share::execution
