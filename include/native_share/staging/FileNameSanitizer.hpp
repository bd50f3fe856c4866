// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_STAGING_FILE_NAME_SANITIZER_HPP
#define NATIVE_SHARE_STAGING_FILE_NAME_SANITIZER_HPP

#include <filesystem>
#include <string>

namespace native_share::staging {

class FileNameSanitizer {
public:
    // True for '/', '\\' and NUL.
    static bool isSeparator(char c);

    // True when any separator-delimited component equals "..".
    static bool containsTraversal(const std::string& untrusted_name);

    // Text after the last separator.
    static std::string lastComponent(const std::string& untrusted_name);

    // Drops every character outside [A-Za-z0-9._-].
    static std::string filterAllowed(const std::string& name);

    // lastComponent + filterAllowed. May return an empty string; callers
    // decide whether that is acceptable.
    static std::string sanitize(const std::string& untrusted_name);

    // True when canonical(candidate).parent_path() == canonical(directory) and
    // the candidate string starts with the directory followed by a separator.
    // The candidate does not need to exist; the directory must.
    static bool isDirectChildOf(const std::filesystem::path& candidate,
                                const std::filesystem::path& directory);
};

}  // namespace native_share::staging

#endif  // NATIVE_SHARE_STAGING_FILE_NAME_SANITIZER_HPP
