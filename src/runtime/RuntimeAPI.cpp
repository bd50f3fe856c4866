// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/runtime/RuntimeAPI.hpp"

#include "native_share/common/ShareError.hpp"
#include "native_share/config/ShareConfig.hpp"
#include "native_share/execution/MainLoopQueue.hpp"
#include "native_share/execution/ThreadPool.hpp"
#include "native_share/presenter/SharePresenter.hpp"
#include "native_share/services/ShareService.hpp"
#include "native_share/staging/StagingArea.hpp"

#include <cstring>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using native_share::common::ShareErrorKind;
using native_share::config::ShareConfig;
using native_share::presenter::PresentationCompletion;
using native_share::presenter::ShareItem;
using native_share::presenter::ShareItemKind;
using native_share::presenter::ShareOutcome;
using native_share::services::ShareRequest;
using native_share::services::ShareResult;

// Bridges SharePresenter onto the host's C callback and token replies.
class CallbackPresenter : public native_share::presenter::SharePresenter {
public:
    CallbackPresenter(NSPresentCallback callback, void* user_data)
        : callback_(callback), user_data_(user_data) {}

    bool isAvailable() const override {
        return callback_ != nullptr;
    }

    void present(const std::vector<ShareItem>& items,
                 const std::optional<std::string>& title,
                 PresentationCompletion completion) override {
        if (!callback_) {
            completion.resolve(ShareOutcome::error("no presenter registered"));
            return;
        }

        uint64_t token = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token = ++next_token_;
            pending_.emplace(token, completion);
        }

        std::vector<NSShareItem> c_items;
        c_items.reserve(items.size());
        for (const auto& item : items) {
            NSShareItem c_item{};
            c_item.kind = item.kind == ShareItemKind::File ? NS_ITEM_FILE
                        : item.kind == ShareItemKind::Url  ? NS_ITEM_URL
                                                           : NS_ITEM_TEXT;
            c_item.value = item.value.c_str();
            c_item.mime_type = item.mime_type.c_str();
            c_items.push_back(c_item);
        }

        callback_(user_data_, token, c_items.data(), c_items.size(),
                  title ? title->c_str() : nullptr);
    }

    bool complete(uint64_t token, const ShareOutcome& outcome) {
        PresentationCompletion completion;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(token);
            if (it == pending_.end()) {
                return false;
            }
            completion = it->second;
            pending_.erase(it);
        }
        return completion.resolve(outcome);
    }

    void abandonAll(const std::string& reason) {
        std::map<uint64_t, PresentationCompletion> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(pending_);
        }
        for (auto& entry : pending) {
            entry.second.resolve(ShareOutcome::error(reason));
        }
    }

private:
    NSPresentCallback callback_;
    void* user_data_;
    std::mutex mutex_;
    uint64_t next_token_ = 0;
    std::map<uint64_t, PresentationCompletion> pending_;
};

struct RuntimeHandle {
    ShareConfig config;
    std::unique_ptr<native_share::staging::StagingArea> staging;
    std::unique_ptr<native_share::execution::ThreadPool> worker;
    native_share::execution::MainLoopQueue ui;
    std::shared_ptr<CallbackPresenter> presenter;
    std::unique_ptr<native_share::services::ShareService> service;
    std::string staging_directory;
};

RuntimeHandle* toImpl(NSRuntimeHandle* handle) {
    return reinterpret_cast<RuntimeHandle*>(handle);
}

int32_t toErrorKind(ShareErrorKind kind) {
    switch (kind) {
        case ShareErrorKind::None:
            return NS_ERROR_NONE;
        case ShareErrorKind::InvalidArgument:
            return NS_ERROR_INVALID_ARGUMENT;
        case ShareErrorKind::Decoding:
            return NS_ERROR_DECODING;
        case ShareErrorKind::Naming:
            return NS_ERROR_NAMING;
        case ShareErrorKind::PathTraversal:
            return NS_ERROR_PATH_TRAVERSAL;
        case ShareErrorKind::Io:
            return NS_ERROR_IO;
        case ShareErrorKind::Presentation:
            return NS_ERROR_PRESENTATION;
        case ShareErrorKind::MissingFile:
            return NS_ERROR_MISSING_FILE;
    }
    return NS_ERROR_IO;
}

// Each report owns its message; ns_runtime_release_report frees it.
char* copyMessage(const std::string& message) {
    auto copy = std::make_unique<char[]>(message.size() + 1);
    std::memcpy(copy.get(), message.c_str(), message.size() + 1);
    return copy.release();
}

NSShareReport makeEmptyReport() {
    NSShareReport report{};
    report.success = false;
    report.error_kind = NS_ERROR_NONE;
    report.error_message = nullptr;
    return report;
}

NSShareReport makeReport(const ShareResult& result) {
    NSShareReport report = makeEmptyReport();
    report.success = result.success;
    report.error_kind = toErrorKind(result.error_kind);
    if (!result.success) {
        report.error_message = copyMessage(result.error_message);
    }
    return report;
}

NSShareReport makeErrorReport(ShareErrorKind kind, const std::string& message) {
    return makeReport(ShareResult::failure(kind, message));
}

std::optional<std::string> optionalString(const char* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

ShareRequest toShareRequest(const NSShareRequest& request) {
    ShareRequest converted;
    converted.text = optionalString(request.text);
    converted.title = optionalString(request.title);
    converted.url = optionalString(request.url);
    for (std::size_t i = 0; request.files && i < request.file_count; ++i) {
        const auto& file = request.files[i];
        native_share::services::SharedFile shared;
        shared.data = file.data ? file.data : "";
        shared.name = file.name ? file.name : "";
        if (file.mime_type && file.mime_type[0] != '\0') {
            shared.mime_type = file.mime_type;
        }
        converted.files.push_back(std::move(shared));
    }
    return converted;
}

NSShareReport waitForResult(std::future<ShareResult> future) {
    try {
        return makeReport(future.get());
    } catch (const std::exception& e) {
        return makeErrorReport(ShareErrorKind::Io, std::string("Share threw exception: ") + e.what());
    }
}

}  // namespace

extern "C" NSRuntimeHandle* ns_runtime_create(const NSRuntimeOptions* options) {
    auto impl = std::make_unique<RuntimeHandle>();

    try {
        if (options && options->config_path && options->config_path[0] != '\0') {
            impl->config = native_share::config::loadShareConfigFromYaml(options->config_path);
        }
        const auto errors = impl->config.validate();
        if (!errors.empty()) {
            for (const auto& err : errors) {
                std::cerr << "Config error: " << err << std::endl;
            }
            return nullptr;
        }

        impl->staging = std::make_unique<native_share::staging::StagingArea>(
            native_share::config::stagingOptionsFromConfig(impl->config));
        impl->staging_directory = impl->staging->stagingDirectory().string();
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to create share runtime: " << e.what() << std::endl;
        return nullptr;
    }

    if (impl->config.cleanup_on_startup) {
        try {
            impl->staging->cleanupAll();
        } catch (const native_share::common::ShareError& e) {
            std::cerr << "Warning: Startup cleanup failed: " << e.what() << std::endl;
        }
    }

    impl->worker = std::make_unique<native_share::execution::ThreadPool>(
        static_cast<std::size_t>(impl->config.worker_threads));
    impl->presenter = std::make_shared<CallbackPresenter>(options ? options->present : nullptr,
                                                          options ? options->user_data : nullptr);
    impl->service = std::make_unique<native_share::services::ShareService>(
        *impl->staging, impl->presenter, *impl->worker, impl->ui);

    return reinterpret_cast<NSRuntimeHandle*>(impl.release());
}

extern "C" void ns_runtime_destroy(NSRuntimeHandle* handle) {
    if (!handle) {
        return;
    }
    auto* impl = toImpl(handle);

    impl->ui.close();
    impl->presenter->abandonAll("share runtime destroyed");
    impl->worker->shutdown();

    if (impl->config.cleanup_on_shutdown) {
        impl->staging->releaseTrackedFiles();
    }
    delete impl;
}

extern "C" bool ns_runtime_can_share(NSRuntimeHandle* handle, const NSShareRequest* descriptor) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return false;
    }
    if (!descriptor) {
        return impl->service->canShare();
    }
    const auto request = toShareRequest(*descriptor);
    return impl->service->canShare(&request);
}

extern "C" NSShareReport ns_runtime_share(NSRuntimeHandle* handle, const NSShareRequest* request) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Invalid runtime handle");
    }
    if (!request) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Share request is null");
    }
    return waitForResult(impl->service->share(toShareRequest(*request)));
}

extern "C" NSShareReport ns_runtime_share_text(NSRuntimeHandle* handle,
                                               const char* text,
                                               const char* title) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Invalid runtime handle");
    }
    if (!text) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Text is null");
    }
    return waitForResult(impl->service->shareText(text, optionalString(title)));
}

extern "C" NSShareReport ns_runtime_share_data(NSRuntimeHandle* handle,
                                               const char* data,
                                               const char* name,
                                               const char* title) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Invalid runtime handle");
    }
    if (!data || !name) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Data and name are required");
    }
    return waitForResult(impl->service->shareData(data, name, optionalString(title)));
}

extern "C" NSShareReport ns_runtime_share_file(NSRuntimeHandle* handle,
                                               const char* path,
                                               const char* title) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Invalid runtime handle");
    }
    if (!path) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "File path is null");
    }
    return waitForResult(impl->service->shareFile(path, optionalString(title)));
}

extern "C" NSShareReport ns_runtime_cleanup(NSRuntimeHandle* handle) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return makeErrorReport(ShareErrorKind::InvalidArgument, "Invalid runtime handle");
    }
    return makeReport(impl->service->cleanup());
}

extern "C" std::size_t ns_runtime_run_ui_tasks(NSRuntimeHandle* handle) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return 0;
    }
    return impl->ui.runPending();
}

extern "C" bool ns_runtime_complete_presentation(NSRuntimeHandle* handle,
                                                 uint64_t token,
                                                 int32_t status,
                                                 const char* message) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return false;
    }

    ShareOutcome outcome;
    switch (status) {
        case NS_SHARE_COMPLETED:
            outcome = ShareOutcome::completed();
            break;
        case NS_SHARE_CANCELLED:
            outcome = ShareOutcome::cancelled();
            break;
        default:
            outcome = ShareOutcome::error(message ? message : "");
            break;
    }
    return impl->presenter->complete(token, outcome);
}

extern "C" const char* ns_runtime_staging_directory(NSRuntimeHandle* handle) {
    auto* impl = toImpl(handle);
    if (!impl) {
        return nullptr;
    }
    return impl->staging_directory.c_str();
}

// Reports own their message, so a handle is not required to release one.
extern "C" void ns_runtime_release_report(NSRuntimeHandle* /*handle*/, NSShareReport* report) {
    if (!report) {
        return;
    }
    std::unique_ptr<const char[]> owned(report->error_message);
    *report = makeEmptyReport();
}
