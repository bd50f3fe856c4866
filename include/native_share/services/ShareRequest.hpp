// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_SERVICES_SHARE_REQUEST_HPP
#define NATIVE_SHARE_SERVICES_SHARE_REQUEST_HPP

#include <optional>
#include <string>
#include <vector>

#include "native_share/common/ShareError.hpp"

namespace native_share::services {

struct SharedFile {
    std::string data;  // base64, optionally as a data URL
    std::string name;  // untrusted display name
    std::string mime_type = "application/octet-stream";
};

struct ShareRequest {
    std::optional<std::string> text;
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::vector<SharedFile> files;

    bool hasContent() const;
};

struct ShareResult {
    bool success = false;
    common::ShareErrorKind error_kind = common::ShareErrorKind::None;
    std::string error_message;

    static ShareResult ok();
    static ShareResult failure(common::ShareErrorKind kind, const std::string& message);
};

}  // namespace native_share::services

#endif  // NATIVE_SHARE_SERVICES_SHARE_REQUEST_HPP
