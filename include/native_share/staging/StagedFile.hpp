// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_STAGING_STAGED_FILE_HPP
#define NATIVE_SHARE_STAGING_STAGED_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace native_share::staging {

enum class StagedFileState {
    Pending,
    Written,
    Presented,
    Released
};

const char* stagedFileStateToString(StagedFileState state);

struct StagedFile {
    std::string untrusted_name;   // as supplied by the application layer
    std::string sanitized_name;   // last component, allow-listed characters only
    std::string unique_name;      // "{uuid}-{sanitized_name}"
    std::filesystem::path path;   // staging directory / unique_name
    std::string mime_type = "application/octet-stream";
    std::uintmax_t size = 0;
};

}  // namespace native_share::staging

#endif  // NATIVE_SHARE_STAGING_STAGED_FILE_HPP
