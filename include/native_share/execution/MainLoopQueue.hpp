// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_EXECUTION_MAIN_LOOP_QUEUE_HPP
#define NATIVE_SHARE_EXECUTION_MAIN_LOOP_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "native_share/execution/Executor.hpp"

namespace native_share::execution {

// UI-thread context. Tasks only run when the host's main loop pumps the
// queue, so native share UIs are always presented from that thread.
class MainLoopQueue : public Executor {
public:
    MainLoopQueue() = default;

    MainLoopQueue(const MainLoopQueue&) = delete;
    MainLoopQueue& operator=(const MainLoopQueue&) = delete;

    bool post(Task task) override;

    // Runs the tasks queued so far. Returns how many ran.
    std::size_t runPending();

    // Pumps the queue until `timeout` elapses, waiting for new tasks in between.
    std::size_t runFor(std::chrono::milliseconds timeout);

    // Rejects new tasks and drops queued ones.
    void close();

    std::size_t pendingCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool closed_ = false;
};

}  // namespace native_share::execution

#endif  // NATIVE_SHARE_EXECUTION_MAIN_LOOP_QUEUE_HPP
