// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_PRESENTER_SHARE_PRESENTER_HPP
#define NATIVE_SHARE_PRESENTER_SHARE_PRESENTER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace native_share::presenter {

enum class ShareItemKind {
    Text,
    Url,
    File
};

struct ShareItem {
    ShareItemKind kind = ShareItemKind::Text;
    std::string value;      // text, URL or absolute file path
    std::string mime_type;  // files only

    static ShareItem text(const std::string& value);
    static ShareItem url(const std::string& value);
    static ShareItem file(const std::string& path, const std::string& mime_type);
};

enum class ShareStatus {
    Completed,
    Cancelled,
    Error
};

const char* shareStatusToString(ShareStatus status);

struct ShareOutcome {
    ShareStatus status = ShareStatus::Completed;
    std::string message;

    static ShareOutcome completed();
    static ShareOutcome cancelled();
    static ShareOutcome error(const std::string& message);
};

// One-shot completion signal handed to a presenter. Copies share state; only
// the first resolve() across all copies reaches the handler.
class PresentationCompletion {
public:
    using Handler = std::function<void(const ShareOutcome&)>;

    PresentationCompletion() = default;
    explicit PresentationCompletion(Handler handler);

    // Returns true if this call resolved the presentation.
    bool resolve(const ShareOutcome& outcome) const;
    bool resolved() const;

private:
    struct State {
        std::atomic<bool> fired{false};
        Handler handler;
    };
    std::shared_ptr<State> state_;
};

// Platform share UI (share sheet, intent chooser, DataTransferManager...).
// present() is always invoked on the UI execution context and must resolve
// the completion exactly once: on selection, dismissal or failure.
class SharePresenter {
public:
    virtual ~SharePresenter() = default;

    virtual bool isAvailable() const {
        return true;
    }

    virtual void present(const std::vector<ShareItem>& items,
                         const std::optional<std::string>& title,
                         PresentationCompletion completion) = 0;
};

// Text and URL items joined with '\n', for targets that only accept one string.
std::string joinTextItems(const std::vector<ShareItem>& items);

}  // namespace native_share::presenter

#endif  // NATIVE_SHARE_PRESENTER_SHARE_PRESENTER_HPP
