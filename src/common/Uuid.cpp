// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/common/Uuid.hpp"

#include "native_share/common/ShareError.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <cstdint>

namespace native_share::common {

namespace {
constexpr std::size_t kUuidTextLength = 36;
constexpr const char* kHexDigits = "0123456789abcdef";

bool isDashPosition(std::size_t index) {
    return index == 8 || index == 13 || index == 18 || index == 23;
}
}  // namespace

std::string generateUuidV4() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw ShareError(ShareErrorKind::Io, "random number generator failed");
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string text;
    text.reserve(kUuidTextLength);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(kHexDigits[bytes[i] >> 4]);
        text.push_back(kHexDigits[bytes[i] & 0x0F]);
    }
    return text;
}

bool isCanonicalUuid(const std::string& text) {
    if (text.size() != kUuidTextLength) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (isDashPosition(i)) {
            if (c != '-') {
                return false;
            }
        } else if (!std::isxdigit(c) || std::isupper(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace native_share::common
