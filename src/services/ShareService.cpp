// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/services/ShareService.hpp"

#include "native_share/common/Base64.hpp"
#include "native_share/common/ShareError.hpp"

#include <atomic>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace native_share::services {

using common::ShareError;
using common::ShareErrorKind;
using presenter::ShareItem;
using presenter::ShareOutcome;
using presenter::ShareStatus;

struct ShareService::Operation {
    ShareRequest request;
    std::optional<std::string> existing_file;
    std::vector<staging::StagedFile> staged;
    std::vector<ShareItem> items;
    std::promise<ShareResult> promise;
    std::atomic<bool> finished{false};
};

ShareService::ShareService(staging::StagingArea& staging,
                           std::shared_ptr<presenter::SharePresenter> presenter,
                           execution::Executor& worker,
                           execution::Executor& ui)
    : staging_(staging),
      presenter_(std::move(presenter)),
      worker_(worker),
      ui_(ui) {}

bool ShareService::canShare(const ShareRequest* descriptor) const {
    if (!presenter_ || !presenter_->isAvailable()) {
        return false;
    }
    return descriptor == nullptr || descriptor->hasContent();
}

std::future<ShareResult> ShareService::share(ShareRequest request) {
    auto op = std::make_shared<Operation>();
    op->request = std::move(request);
    return start(op);
}

std::future<ShareResult> ShareService::shareText(const std::string& text,
                                                 const std::optional<std::string>& title) {
    ShareRequest request;
    request.text = text;
    request.title = title;
    return share(std::move(request));
}

std::future<ShareResult> ShareService::shareData(const std::string& data,
                                                 const std::string& name,
                                                 const std::optional<std::string>& title,
                                                 const std::string& mime_type) {
    SharedFile file;
    file.data = data;
    file.name = name;
    if (!mime_type.empty()) {
        file.mime_type = mime_type;
    }

    ShareRequest request;
    request.title = title;
    request.files.push_back(std::move(file));
    return share(std::move(request));
}

std::future<ShareResult> ShareService::shareFile(const std::string& path,
                                                 const std::optional<std::string>& title) {
    auto op = std::make_shared<Operation>();
    op->request.title = title;
    op->existing_file = path;
    return start(op);
}

ShareResult ShareService::cleanup() {
    try {
        staging_.cleanupAll();
    } catch (const ShareError& e) {
        return ShareResult::failure(e.kind(), e.what());
    }
    return ShareResult::ok();
}

std::future<ShareResult> ShareService::start(std::shared_ptr<Operation> op) {
    auto future = op->promise.get_future();

    if (op->existing_file) {
        if (op->existing_file->empty()) {
            finish(op, ShareResult::failure(ShareErrorKind::InvalidArgument, "file path is empty"));
            return future;
        }
    } else if (!op->request.hasContent()) {
        finish(op, ShareResult::failure(ShareErrorKind::InvalidArgument,
                                        "nothing to share: text, url and files are all empty"));
        return future;
    }

    if (!presenter_ || !presenter_->isAvailable()) {
        finish(op, ShareResult::failure(ShareErrorKind::Presentation,
                                        "native share UI is not available on this platform"));
        return future;
    }

    const bool posted = worker_.post([this, op]() {
        if (op->existing_file) {
            verifySourceFile(op);
        } else {
            stageFiles(op);
        }
    });
    if (!posted) {
        finish(op, ShareResult::failure(ShareErrorKind::Presentation,
                                        "share service is shutting down"));
    }
    return future;
}

void ShareService::stageFiles(const std::shared_ptr<Operation>& op) {
    const auto& request = op->request;
    if (request.text && !request.text->empty()) {
        op->items.push_back(ShareItem::text(*request.text));
    }
    if (request.url && !request.url->empty()) {
        op->items.push_back(ShareItem::url(*request.url));
    }

    try {
        for (const auto& file : request.files) {
            const auto payload = common::decodeBase64(file.data);
            auto staged = staging_.createStagedFile(file.name, payload, file.mime_type);
            op->items.push_back(ShareItem::file(staged.path.string(), staged.mime_type));
            op->staged.push_back(std::move(staged));
        }
    } catch (const ShareError& e) {
        releaseStaged(op);
        finish(op, ShareResult::failure(e.kind(), e.what()));
        return;
    } catch (const std::exception& e) {
        releaseStaged(op);
        finish(op, ShareResult::failure(ShareErrorKind::Io, e.what()));
        return;
    }

    schedulePresentation(op);
}

void ShareService::verifySourceFile(const std::shared_ptr<Operation>& op) {
    const std::filesystem::path path(*op->existing_file);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        finish(op, ShareResult::failure(ShareErrorKind::MissingFile, path.string()));
        return;
    }

    auto absolute = std::filesystem::absolute(path, ec);
    op->items.push_back(ShareItem::file(ec ? path.string() : absolute.string(),
                                        "application/octet-stream"));
    schedulePresentation(op);
}

void ShareService::schedulePresentation(const std::shared_ptr<Operation>& op) {
    const bool posted = ui_.post([this, op]() { present(op); });
    if (!posted) {
        releaseStaged(op);
        finish(op, ShareResult::failure(ShareErrorKind::Presentation,
                                        "UI context is no longer accepting tasks"));
    }
}

void ShareService::present(const std::shared_ptr<Operation>& op) {
    for (const auto& file : op->staged) {
        staging_.markPresented(file);
    }

    presenter::PresentationCompletion completion(
        [this, op](const ShareOutcome& outcome) { onPresentationFinished(op, outcome); });

    try {
        presenter_->present(op->items, op->request.title, completion);
    } catch (const std::exception& e) {
        completion.resolve(ShareOutcome::error(e.what()));
    }
}

void ShareService::onPresentationFinished(const std::shared_ptr<Operation>& op,
                                          const ShareOutcome& outcome) {
    // Dismissing the sheet without a target is a normal completion
    ShareResult result = ShareResult::ok();
    if (outcome.status == ShareStatus::Error) {
        result = ShareResult::failure(ShareErrorKind::Presentation,
                                      outcome.message.empty() ? "share dialog reported an error"
                                                              : outcome.message);
    }

    if (op->staged.empty()) {
        finish(op, result);
        return;
    }

    const bool posted = worker_.post([this, op, result]() {
        releaseStaged(op);
        finish(op, result);
    });
    if (!posted) {
        releaseStaged(op);
        finish(op, result);
    }
}

void ShareService::releaseStaged(const std::shared_ptr<Operation>& op) {
    for (const auto& file : op->staged) {
        staging_.releaseStagedFile(file);
    }
    op->staged.clear();
}

void ShareService::finish(const std::shared_ptr<Operation>& op, const ShareResult& result) {
    if (op->finished.exchange(true)) {
        return;
    }
    op->promise.set_value(result);
}

}  // namespace native_share::services
