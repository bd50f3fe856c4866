// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_SERVICES_SHARE_SERVICE_HPP
#define NATIVE_SHARE_SERVICES_SHARE_SERVICE_HPP

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "native_share/execution/Executor.hpp"
#include "native_share/presenter/SharePresenter.hpp"
#include "native_share/services/ShareRequest.hpp"
#include "native_share/staging/StagingArea.hpp"

namespace native_share::services {

// Application-facing share operations.
//
// Decoding and staging run on `worker`, presentation on `ui`; the presenter's
// completion hands release back to `worker`. The returned futures resolve
// after staged files have been released. The service, the staging area and
// both executors must outlive every pending operation.
class ShareService {
public:
    ShareService(staging::StagingArea& staging,
                 std::shared_ptr<presenter::SharePresenter> presenter,
                 execution::Executor& worker,
                 execution::Executor& ui);

    bool canShare(const ShareRequest* descriptor = nullptr) const;

    std::future<ShareResult> share(ShareRequest request);

    std::future<ShareResult> shareText(const std::string& text,
                                       const std::optional<std::string>& title = std::nullopt);

    std::future<ShareResult> shareData(const std::string& data,
                                       const std::string& name,
                                       const std::optional<std::string>& title = std::nullopt,
                                       const std::string& mime_type = "");

    // Shares an existing file as-is; nothing is staged or released.
    std::future<ShareResult> shareFile(const std::string& path,
                                       const std::optional<std::string>& title = std::nullopt);

    ShareResult cleanup();

private:
    struct Operation;

    staging::StagingArea& staging_;
    std::shared_ptr<presenter::SharePresenter> presenter_;
    execution::Executor& worker_;
    execution::Executor& ui_;

    std::future<ShareResult> start(std::shared_ptr<Operation> op);
    void stageFiles(const std::shared_ptr<Operation>& op);
    void verifySourceFile(const std::shared_ptr<Operation>& op);
    void schedulePresentation(const std::shared_ptr<Operation>& op);
    void present(const std::shared_ptr<Operation>& op);
    void onPresentationFinished(const std::shared_ptr<Operation>& op,
                                const presenter::ShareOutcome& outcome);
    void releaseStaged(const std::shared_ptr<Operation>& op);
    void finish(const std::shared_ptr<Operation>& op, const ShareResult& result);
};

}  // namespace native_share::services

#endif  // NATIVE_SHARE_SERVICES_SHARE_SERVICE_HPP
