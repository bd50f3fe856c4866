// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/staging/StagingArea.hpp"

#include "native_share/common/ShareError.hpp"
#include "native_share/common/Uuid.hpp"
#include "native_share/staging/FileNameSanitizer.hpp"
#include "native_share/utils/ErrorAccumulator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace native_share::staging {

namespace fs = std::filesystem;

using common::ShareError;
using common::ShareErrorKind;

namespace {

constexpr const char* kDefaultMimeType = "application/octet-stream";

fs::path absoluteEnvPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return {};
    }
    fs::path path(value);
    return path.is_absolute() ? path : fs::path();
}

std::string errnoMessage() {
    return std::strerror(errno);
}

// The root may be a shared /tmp, so an existing directory is only adopted when
// this user owns it, and it is narrowed to owner-only access.
void secureDirectory(const fs::path& dir) {
    struct stat st {};
    if (::lstat(dir.c_str(), &st) != 0) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to stat temp dir " + dir.string() + ": " + errnoMessage());
    }
    if (!S_ISDIR(st.st_mode)) {
        throw ShareError(ShareErrorKind::Io,
                         "Staging path exists and is not a directory: " + dir.string());
    }
    if (st.st_uid != ::geteuid()) {
        throw ShareError(ShareErrorKind::Io,
                         "Staging directory is owned by another user: " + dir.string());
    }
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0 && ::chmod(dir.c_str(), S_IRWXU) != 0) {
        throw ShareError(ShareErrorKind::Io,
                         "Cannot restrict permissions of " + dir.string() + ": " + errnoMessage());
    }
}

}  // namespace

const char* stagedFileStateToString(StagedFileState state) {
    switch (state) {
        case StagedFileState::Pending:
            return "pending";
        case StagedFileState::Written:
            return "written";
        case StagedFileState::Presented:
            return "presented";
        case StagedFileState::Released:
            return "released";
    }
    return "unknown";
}

fs::path resolveStagingRoot(StagingRoot root) {
    if (root == StagingRoot::Cache) {
        const auto xdg_cache = absoluteEnvPath("XDG_CACHE_HOME");
        if (!xdg_cache.empty()) {
            return xdg_cache;
        }
        const auto home = absoluteEnvPath("HOME");
        if (!home.empty()) {
            return home / ".cache";
        }
    }

    std::error_code ec;
    auto temp = fs::temp_directory_path(ec);
    if (ec) {
        throw ShareError(ShareErrorKind::Io, "Failed to locate temp directory: " + ec.message());
    }
    return temp;
}

StagingArea::StagingArea(StagingAreaOptions options)
    : options_(std::move(options)) {}

fs::path StagingArea::stagingDirectory() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (directory_) {
            return *directory_;
        }
    }
    const fs::path root = options_.root_override.empty()
        ? resolveStagingRoot(options_.root)
        : options_.root_override;
    return root / kStagingDirectoryName;
}

fs::path StagingArea::ensureStagingDirectory() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureDirectoryLocked();
}

fs::path StagingArea::ensureDirectoryLocked() {
    if (!directory_) {
        const fs::path root = options_.root_override.empty()
            ? resolveStagingRoot(options_.root)
            : options_.root_override;
        directory_ = root / kStagingDirectoryName;
    }
    const fs::path& dir = *directory_;

    std::error_code ec;
    if (fs::is_symlink(dir, ec)) {
        throw ShareError(ShareErrorKind::Io,
                         "Staging directory is a symbolic link: " + dir.string());
    }

    const auto status = fs::status(dir, ec);
    if (status.type() == fs::file_type::directory) {
        secureDirectory(dir);
        return dir;
    }
    if (status.type() != fs::file_type::not_found) {
        throw ShareError(ShareErrorKind::Io,
                         "Staging path exists and is not a directory: " + dir.string());
    }

    ec.clear();
    fs::create_directories(dir, ec);
    if (ec) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to create temp dir " + dir.string() + ": " + ec.message());
    }
    secureDirectory(dir);
    return dir;
}

StagedFile StagingArea::createStagedFile(const std::string& untrusted_name,
                                         const std::vector<uint8_t>& payload,
                                         const std::string& mime_type) {
    const fs::path dir = ensureStagingDirectory();

    if (FileNameSanitizer::containsTraversal(untrusted_name)) {
        throw ShareError(ShareErrorKind::PathTraversal,
                         "file name contains a parent directory reference");
    }

    StagedFile file;
    file.untrusted_name = untrusted_name;
    file.sanitized_name = FileNameSanitizer::sanitize(untrusted_name);
    if (file.sanitized_name.empty()) {
        throw ShareError(ShareErrorKind::Naming,
                         "file name is empty after removing disallowed characters");
    }

    if (options_.max_payload_bytes > 0 && payload.size() > options_.max_payload_bytes) {
        throw ShareError(ShareErrorKind::Naming,
                         "payload of " + std::to_string(payload.size()) +
                         " bytes exceeds the limit of " +
                         std::to_string(options_.max_payload_bytes) + " bytes");
    }

    file.unique_name = common::generateUuidV4() + "-" + file.sanitized_name;

    const fs::path candidate = dir / file.unique_name;
    if (!FileNameSanitizer::isDirectChildOf(candidate, dir)) {
        throw ShareError(ShareErrorKind::PathTraversal,
                         "resolved path escapes the staging directory");
    }

    std::error_code ec;
    file.path = fs::weakly_canonical(candidate, ec);
    if (ec) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to resolve " + candidate.string() + ": " + ec.message());
    }
    file.mime_type = mime_type.empty() ? kDefaultMimeType : mime_type;
    file.size = payload.size();

    writeAtomically(file.path.parent_path(), file.unique_name, payload);

    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.push_back(TrackedFile{file, StagedFileState::Written});
    return file;
}

void StagingArea::writeAtomically(const fs::path& directory,
                                  const std::string& unique_name,
                                  const std::vector<uint8_t>& payload) const {
    const fs::path partial = directory / ("." + unique_name + ".partial");
    const fs::path target = directory / unique_name;

    auto discardPartial = [&partial]() {
        std::error_code ignored;
        fs::remove(partial, ignored);
    };

    // Created exclusively and owner-only; rename keeps the mode
    const int fd = ::open(partial.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                          S_IRUSR | S_IWUSR);
    if (fd < 0) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to create temp file " + partial.string() + ": " + errnoMessage());
    }

    std::size_t offset = 0;
    while (offset < payload.size()) {
        const ssize_t written = ::write(fd, payload.data() + offset, payload.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string cause = errnoMessage();
            ::close(fd);
            discardPartial();
            throw ShareError(ShareErrorKind::Io,
                             "Failed to write to temp file " + partial.string() + ": " + cause);
        }
        offset += static_cast<std::size_t>(written);
    }
    if (::close(fd) != 0) {
        const std::string cause = errnoMessage();
        discardPartial();
        throw ShareError(ShareErrorKind::Io,
                         "Failed to write to temp file " + partial.string() + ": " + cause);
    }

    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        discardPartial();
        throw ShareError(ShareErrorKind::Io,
                         "Failed to persist temp file " + target.string() + ": " + ec.message());
    }
}

void StagingArea::markPresented(const StagedFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : tracked_) {
        if (entry.file.path == file.path && entry.state == StagedFileState::Written) {
            entry.state = StagedFileState::Presented;
        }
    }
}

void StagingArea::releaseStagedFile(const StagedFile& file) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                      [&file](const TrackedFile& entry) {
                                          return entry.file.path == file.path;
                                      }),
                       tracked_.end());
    }

    std::error_code ec;
    fs::remove(file.path, ec);
    if (ec) {
        std::cerr << "Warning: Failed to delete staged file " << file.path << ": " << ec.message()
                  << std::endl;
    }
}

std::string StagingArea::releaseTrackedFiles() {
    std::vector<TrackedFile> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(tracked_);
    }

    utils::ErrorAccumulator errors;
    for (const auto& entry : pending) {
        std::error_code ec;
        fs::remove(entry.file.path, ec);
        errors.addIfError("Failed to delete file " + entry.file.path.string(), ec);
    }
    if (!errors.empty()) {
        std::cerr << "Warning: " << errors.count() << " of " << pending.size()
                  << " staged files could not be deleted: " << errors.str() << std::endl;
    }
    return errors.str();
}

void StagingArea::cleanupAll() {
    const fs::path dir = stagingDirectory();

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const auto status = fs::symlink_status(dir, ec);
    if (status.type() == fs::file_type::not_found) {
        tracked_.clear();
        return;
    }
    if (ec) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to cleanup temp dir " + dir.string() + ": " + ec.message());
    }

    fs::remove_all(dir, ec);
    if (ec) {
        throw ShareError(ShareErrorKind::Io,
                         "Failed to cleanup temp dir " + dir.string() + ": " + ec.message());
    }
    tracked_.clear();
}

StagedFileState StagingArea::state(const StagedFile& file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : tracked_) {
        if (entry.file.path == file.path) {
            return entry.state;
        }
    }
    return StagedFileState::Released;
}

std::vector<StagedFile> StagingArea::trackedFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StagedFile> files;
    files.reserve(tracked_.size());
    for (const auto& entry : tracked_) {
        files.push_back(entry.file);
    }
    return files;
}

}  // namespace native_share::staging
