// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/presenter/ConsolePresenter.hpp"

#include <filesystem>
#include <system_error>

namespace native_share::presenter {

ConsolePresenter::ConsolePresenter(std::ostream& out)
    : out_(out) {}

void ConsolePresenter::present(const std::vector<ShareItem>& items,
                               const std::optional<std::string>& title,
                               PresentationCompletion completion) {
    out_ << "Share sheet";
    if (title && !title->empty()) {
        out_ << " \"" << *title << "\"";
    }
    out_ << "\n";

    const std::string text = joinTextItems(items);
    if (!text.empty()) {
        out_ << "  Text             : " << text << "\n";
    }

    for (const auto& item : items) {
        if (item.kind != ShareItemKind::File) {
            continue;
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(item.value, ec);
        out_ << "  File             : " << item.value << " (" << item.mime_type;
        if (!ec) {
            out_ << ", " << size << " bytes";
        }
        out_ << ")\n";
    }

    completion.resolve(ShareOutcome::completed());
}

}  // namespace native_share::presenter
