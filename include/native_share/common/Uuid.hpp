// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_COMMON_UUID_HPP
#define NATIVE_SHARE_COMMON_UUID_HPP

#include <string>

namespace native_share::common {

// Random (version 4) UUID in canonical lowercase 8-4-4-4-12 form.
std::string generateUuidV4();

bool isCanonicalUuid(const std::string& text);

}  // namespace native_share::common

#endif  // NATIVE_SHARE_COMMON_UUID_HPP
