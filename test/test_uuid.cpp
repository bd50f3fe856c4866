// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <set>

#include "native_share/common/Uuid.hpp"

using native_share::common::generateUuidV4;
using native_share::common::isCanonicalUuid;

TEST(UuidTest, GeneratesCanonicalVersion4) {
    const auto uuid = generateUuidV4();
    ASSERT_EQ(36u, uuid.size());
    EXPECT_TRUE(isCanonicalUuid(uuid));
    EXPECT_EQ('4', uuid[14]);
    EXPECT_NE(std::string::npos, std::string("89ab").find(uuid[19]));
}

TEST(UuidTest, GeneratesDistinctValues) {
    std::set<std::string> seen;
    for (int i = 0; i < 256; ++i) {
        EXPECT_TRUE(seen.insert(generateUuidV4()).second);
    }
}

TEST(UuidTest, RejectsNonCanonicalText) {
    EXPECT_FALSE(isCanonicalUuid(""));
    EXPECT_FALSE(isCanonicalUuid("123e4567e89b12d3a456426614174000"));
    EXPECT_FALSE(isCanonicalUuid("123E4567-E89B-42D3-A456-426614174000"));
    EXPECT_FALSE(isCanonicalUuid("123e4567-e89b-42d3-a456-42661417400g"));
    EXPECT_TRUE(isCanonicalUuid("123e4567-e89b-42d3-a456-426614174000"));
}
