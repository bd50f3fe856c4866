// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_EXECUTION_EXECUTOR_HPP
#define NATIVE_SHARE_EXECUTION_EXECUTOR_HPP

#include <functional>

namespace native_share::execution {

using Task = std::function<void()>;

// An execution context that runs posted tasks at some later point.
class Executor {
public:
    virtual ~Executor() = default;

    // Returns false when the context no longer accepts tasks.
    virtual bool post(Task task) = 0;
};

}  // namespace native_share::execution

#endif  // NATIVE_SHARE_EXECUTION_EXECUTOR_HPP
