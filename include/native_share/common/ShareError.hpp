// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_COMMON_SHARE_ERROR_HPP
#define NATIVE_SHARE_COMMON_SHARE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace native_share::common {

enum class ShareErrorKind {
    None,
    InvalidArgument,
    Decoding,
    Naming,
    PathTraversal,
    Io,
    Presentation,
    MissingFile
};

// Stable lowercase identifier, e.g. "path_traversal"
const char* errorKindToString(ShareErrorKind kind);

class ShareError : public std::runtime_error {
public:
    ShareError(ShareErrorKind kind, const std::string& message);

    ShareErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ShareErrorKind kind_;
};

}  // namespace native_share::common

#endif  // NATIVE_SHARE_COMMON_SHARE_ERROR_HPP
