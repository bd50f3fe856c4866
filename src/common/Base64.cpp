// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/common/Base64.hpp"

#include "native_share/common/ShareError.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <limits>

namespace native_share::common {

namespace {

bool isBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

std::string removeWhitespace(const std::string& input) {
    std::string compact;
    compact.reserve(input.size());
    for (unsigned char c : input) {
        if (!std::isspace(c)) {
            compact.push_back(static_cast<char>(c));
        }
    }
    return compact;
}

void validateAlphabet(const std::string& compact) {
    if (compact.size() % 4 != 0) {
        throw ShareError(ShareErrorKind::Decoding, "base64 length is not a multiple of 4");
    }

    const std::size_t size = compact.size();
    for (std::size_t i = 0; i < size; ++i) {
        const auto c = static_cast<unsigned char>(compact[i]);
        if (isBase64Char(c)) {
            continue;
        }
        // '=' may only pad the final one or two positions
        const bool trailing_pad = c == '=' &&
            (i == size - 1 || (i == size - 2 && compact[size - 1] == '='));
        if (!trailing_pad) {
            throw ShareError(ShareErrorKind::Decoding,
                             "invalid base64 character at offset " + std::to_string(i));
        }
    }
}

}  // namespace

std::string stripDataUrlPrefix(const std::string& encoded) {
    if (encoded.rfind("data:", 0) != 0) {
        return encoded;
    }
    const auto comma = encoded.find(',');
    if (comma == std::string::npos) {
        return encoded;
    }
    const std::string header = encoded.substr(0, comma);
    if (header.size() < 7 || header.compare(header.size() - 7, 7, ";base64") != 0) {
        throw ShareError(ShareErrorKind::Decoding, "data URL is not base64 encoded");
    }
    return encoded.substr(comma + 1);
}

std::vector<uint8_t> decodeBase64(const std::string& encoded) {
    const std::string compact = removeWhitespace(stripDataUrlPrefix(encoded));
    if (compact.empty()) {
        return {};
    }
    validateAlphabet(compact);

    if (compact.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw ShareError(ShareErrorKind::Decoding, "base64 payload is too large");
    }

    std::vector<uint8_t> decoded(compact.size() / 4 * 3);
    const int written = EVP_DecodeBlock(decoded.data(),
                                        reinterpret_cast<const unsigned char*>(compact.data()),
                                        static_cast<int>(compact.size()));
    if (written < 0) {
        throw ShareError(ShareErrorKind::Decoding, "base64 payload could not be decoded");
    }

    // EVP_DecodeBlock counts padding bytes as output
    std::size_t padding = 0;
    if (compact[compact.size() - 1] == '=') {
        ++padding;
        if (compact[compact.size() - 2] == '=') {
            ++padding;
        }
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

std::string encodeBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        data.data(),
                                        static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

}  // namespace native_share::common
