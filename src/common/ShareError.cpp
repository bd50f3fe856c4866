// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/common/ShareError.hpp"

namespace native_share::common {

namespace {

std::string prefixFor(ShareErrorKind kind) {
    switch (kind) {
        case ShareErrorKind::InvalidArgument:
            return "Invalid arguments: ";
        case ShareErrorKind::Decoding:
            return "Invalid payload: ";
        case ShareErrorKind::Naming:
            return "Invalid file name: ";
        case ShareErrorKind::PathTraversal:
            return "Path traversal rejected: ";
        case ShareErrorKind::Io:
            return "Temporary file operation failed: ";
        case ShareErrorKind::Presentation:
            return "Failed to interact with native sharing API: ";
        case ShareErrorKind::MissingFile:
            return "File not found: ";
        case ShareErrorKind::None:
            break;
    }
    return "";
}

}  // namespace

const char* errorKindToString(ShareErrorKind kind) {
    switch (kind) {
        case ShareErrorKind::None:
            return "none";
        case ShareErrorKind::InvalidArgument:
            return "invalid_argument";
        case ShareErrorKind::Decoding:
            return "decoding";
        case ShareErrorKind::Naming:
            return "naming";
        case ShareErrorKind::PathTraversal:
            return "path_traversal";
        case ShareErrorKind::Io:
            return "io";
        case ShareErrorKind::Presentation:
            return "presentation";
        case ShareErrorKind::MissingFile:
            return "missing_file";
    }
    return "unknown";
}

ShareError::ShareError(ShareErrorKind kind, const std::string& message)
    : std::runtime_error(prefixFor(kind) + message), kind_(kind) {}

}  // namespace native_share::common
