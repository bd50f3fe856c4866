// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_STAGING_STAGING_AREA_HPP
#define NATIVE_SHARE_STAGING_STAGING_AREA_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "native_share/staging/StagedFile.hpp"

namespace native_share::staging {

constexpr const char* kStagingDirectoryName = "native-share";

enum class StagingRoot {
    Temp,   // std::filesystem::temp_directory_path()
    Cache   // $XDG_CACHE_HOME, then $HOME/.cache, then Temp
};

struct StagingAreaOptions {
    StagingRoot root = StagingRoot::Temp;
    // Host-provided temp/cache root. Empty selects the OS location for `root`.
    std::filesystem::path root_override;
    // 0 disables the limit.
    std::uintmax_t max_payload_bytes = 0;
};

std::filesystem::path resolveStagingRoot(StagingRoot root);

// Owns the process-wide staging directory. Construction touches nothing on
// disk; the directory is created on first use.
//
// cleanupAll() removes the whole directory, including files that a share
// target may still be reading if a presentation is in flight.
class StagingArea {
public:
    explicit StagingArea(StagingAreaOptions options = StagingAreaOptions());
    ~StagingArea() = default;

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    // Path of the staging directory; does not create it.
    std::filesystem::path stagingDirectory() const;

    // Creates the directory (and parents) when absent. Throws ShareError(Io).
    std::filesystem::path ensureStagingDirectory();

    // Materializes `payload` under a collision-free, traversal-safe name.
    // Throws ShareError(Naming | PathTraversal | Io); nothing is written on failure.
    StagedFile createStagedFile(const std::string& untrusted_name,
                                const std::vector<uint8_t>& payload,
                                const std::string& mime_type = "");

    void markPresented(const StagedFile& file);

    // Best-effort delete of one file. Never throws.
    void releaseStagedFile(const StagedFile& file);

    // Deletes every tracked file. Returns the joined failure messages.
    std::string releaseTrackedFiles();

    // Removes the staging directory recursively. A missing directory is
    // already clean. Throws ShareError(Io) when removal fails.
    void cleanupAll();

    StagedFileState state(const StagedFile& file) const;
    std::vector<StagedFile> trackedFiles() const;

    const StagingAreaOptions& options() const {
        return options_;
    }

private:
    struct TrackedFile {
        StagedFile file;
        StagedFileState state = StagedFileState::Pending;
    };

    StagingAreaOptions options_;
    mutable std::mutex mutex_;
    std::optional<std::filesystem::path> directory_;
    std::vector<TrackedFile> tracked_;

    std::filesystem::path ensureDirectoryLocked();
    void writeAtomically(const std::filesystem::path& directory,
                         const std::string& unique_name,
                         const std::vector<uint8_t>& payload) const;
};

}  // namespace native_share::staging

#endif  // NATIVE_SHARE_STAGING_STAGING_AREA_HPP
