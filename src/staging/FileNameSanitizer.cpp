// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/staging/FileNameSanitizer.hpp"

#include <cctype>
#include <system_error>

namespace native_share::staging {

namespace {

bool isAllowed(unsigned char c) {
    return (c < 0x80 && std::isalnum(c)) || c == '.' || c == '_' || c == '-';
}

}  // namespace

bool FileNameSanitizer::isSeparator(char c) {
    return c == '/' || c == '\\' || c == '\0';
}

bool FileNameSanitizer::containsTraversal(const std::string& untrusted_name) {
    std::string component;
    for (std::size_t i = 0; i <= untrusted_name.size(); ++i) {
        if (i == untrusted_name.size() || isSeparator(untrusted_name[i])) {
            if (component == "..") {
                return true;
            }
            component.clear();
        } else {
            component.push_back(untrusted_name[i]);
        }
    }
    return false;
}

std::string FileNameSanitizer::lastComponent(const std::string& untrusted_name) {
    for (std::size_t i = untrusted_name.size(); i > 0; --i) {
        if (isSeparator(untrusted_name[i - 1])) {
            return untrusted_name.substr(i);
        }
    }
    return untrusted_name;
}

std::string FileNameSanitizer::filterAllowed(const std::string& name) {
    std::string filtered;
    filtered.reserve(name.size());
    for (unsigned char c : name) {
        if (isAllowed(c)) {
            filtered.push_back(static_cast<char>(c));
        }
    }
    return filtered;
}

std::string FileNameSanitizer::sanitize(const std::string& untrusted_name) {
    return filterAllowed(lastComponent(untrusted_name));
}

bool FileNameSanitizer::isDirectChildOf(const std::filesystem::path& candidate,
                                        const std::filesystem::path& directory) {
    std::error_code ec;
    const auto canonical_dir = std::filesystem::canonical(directory, ec);
    if (ec) {
        return false;
    }
    const auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return false;
    }

    if (canonical_candidate.parent_path() != canonical_dir) {
        return false;
    }

    // Exact prefix with separator so "shares2/x" never matches "shares"
    const std::string dir_prefix =
        canonical_dir.string() + static_cast<char>(std::filesystem::path::preferred_separator);
    const std::string candidate_text = canonical_candidate.string();
    return candidate_text.size() > dir_prefix.size() &&
           candidate_text.compare(0, dir_prefix.size(), dir_prefix) == 0;
}

}  // namespace native_share::staging
