// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/services/ShareRequest.hpp"

namespace native_share::services {

bool ShareRequest::hasContent() const {
    return (text && !text->empty()) || (url && !url->empty()) || !files.empty();
}

ShareResult ShareResult::ok() {
    ShareResult result;
    result.success = true;
    return result;
}

ShareResult ShareResult::failure(common::ShareErrorKind kind, const std::string& message) {
    ShareResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

}  // namespace native_share::services
