// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_COMMON_BASE64_HPP
#define NATIVE_SHARE_COMMON_BASE64_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace native_share::common {

// Decodes standard padded base64. ASCII whitespace is ignored and a leading
// "data:<mime>;base64," prefix is stripped. Throws ShareError(Decoding).
std::vector<uint8_t> decodeBase64(const std::string& encoded);

std::string encodeBase64(const std::vector<uint8_t>& data);

// Removes a "data:...;base64," prefix if present.
std::string stripDataUrlPrefix(const std::string& encoded);

}  // namespace native_share::common

#endif  // NATIVE_SHARE_COMMON_BASE64_HPP
