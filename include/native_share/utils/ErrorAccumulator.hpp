// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_UTILS_ERROR_ACCUMULATOR_HPP
#define NATIVE_SHARE_UTILS_ERROR_ACCUMULATOR_HPP

#include <cstddef>
#include <string>
#include <system_error>

namespace native_share::utils {

// Collects best-effort failures into a single "; "-separated message.
class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
        ++count_;
    }

    // Records "<context>: <ec.message()>" when ec holds an error.
    void addIfError(const std::string& context, const std::error_code& ec) {
        if (ec) {
            add(context + ": " + ec.message());
        }
    }

    bool empty() const {
        return messages_.empty();
    }

    std::size_t count() const {
        return count_;
    }

    const std::string& str() const {
        return messages_;
    }

private:
    std::string messages_;
    std::size_t count_ = 0;
};

}  // namespace native_share::utils

#endif  // NATIVE_SHARE_UTILS_ERROR_ACCUMULATOR_HPP
