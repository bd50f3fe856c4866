// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_EXECUTION_THREAD_POOL_HPP
#define NATIVE_SHARE_EXECUTION_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "native_share/execution/Executor.hpp"

namespace native_share::execution {

// Background worker context for blocking file I/O.
class ThreadPool : public Executor {
public:
    explicit ThreadPool(std::size_t num_threads = 1);
    ~ThreadPool() override;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    bool post(Task task) override;

    // Runs every queued task, then joins the workers. Idempotent.
    // Must not be called from a task running on this pool.
    void shutdown();

    std::size_t size() const {
        return workers_.size();
    }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace native_share::execution

#endif  // NATIVE_SHARE_EXECUTION_THREAD_POOL_HPP
