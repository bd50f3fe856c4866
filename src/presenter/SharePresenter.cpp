// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/presenter/SharePresenter.hpp"

#include <utility>

namespace native_share::presenter {

ShareItem ShareItem::text(const std::string& value) {
    return ShareItem{ShareItemKind::Text, value, "text/plain"};
}

ShareItem ShareItem::url(const std::string& value) {
    return ShareItem{ShareItemKind::Url, value, "text/uri-list"};
}

ShareItem ShareItem::file(const std::string& path, const std::string& mime_type) {
    return ShareItem{ShareItemKind::File, path, mime_type};
}

const char* shareStatusToString(ShareStatus status) {
    switch (status) {
        case ShareStatus::Completed:
            return "completed";
        case ShareStatus::Cancelled:
            return "cancelled";
        case ShareStatus::Error:
            return "error";
    }
    return "unknown";
}

ShareOutcome ShareOutcome::completed() {
    return ShareOutcome{ShareStatus::Completed, ""};
}

ShareOutcome ShareOutcome::cancelled() {
    return ShareOutcome{ShareStatus::Cancelled, ""};
}

ShareOutcome ShareOutcome::error(const std::string& message) {
    return ShareOutcome{ShareStatus::Error, message};
}

PresentationCompletion::PresentationCompletion(Handler handler)
    : state_(std::make_shared<State>()) {
    state_->handler = std::move(handler);
}

bool PresentationCompletion::resolve(const ShareOutcome& outcome) const {
    if (!state_) {
        return false;
    }
    if (state_->fired.exchange(true)) {
        return false;
    }
    if (state_->handler) {
        state_->handler(outcome);
    }
    return true;
}

bool PresentationCompletion::resolved() const {
    return state_ && state_->fired.load();
}

std::string joinTextItems(const std::vector<ShareItem>& items) {
    std::string combined;
    for (const auto& item : items) {
        if (item.kind == ShareItemKind::File || item.value.empty()) {
            continue;
        }
        if (!combined.empty()) {
            combined += '\n';
        }
        combined += item.value;
    }
    return combined;
}

}  // namespace native_share::presenter
