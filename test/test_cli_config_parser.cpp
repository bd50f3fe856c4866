// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <stdexcept>

#include "native_share/config/CliConfigParser.hpp"

using native_share::config::parseConfigPath;
using native_share::config::parseShareCommandArgs;

TEST(CliConfigParserTest, ExtractsPathFromSingleArgument) {
    std::vector<std::string> args = {"config.yaml"};
    EXPECT_EQ("config.yaml", parseConfigPath(args));
}

TEST(CliConfigParserTest, RejectsMissingArgument) {
    std::vector<std::string> args;
    EXPECT_THROW(parseConfigPath(args), std::invalid_argument);
}

TEST(CliConfigParserTest, RejectsExtraArguments) {
    std::vector<std::string> args = {"one.yaml", "two.yaml"};
    EXPECT_THROW(parseConfigPath(args), std::invalid_argument);
}

TEST(CliConfigParserTest, RejectsEmptyPath) {
    std::vector<std::string> args = {""};
    EXPECT_THROW(parseConfigPath(args), std::invalid_argument);
}

TEST(CliConfigParserTest, ParsesShareCommandArguments) {
    const auto parsed = parseShareCommandArgs({"config.yaml", "request.yaml"});
    EXPECT_EQ("config.yaml", parsed.config_path);
    EXPECT_EQ("request.yaml", parsed.request_path);
}

TEST(CliConfigParserTest, ShareCommandNeedsBothPaths) {
    EXPECT_THROW(parseShareCommandArgs({"config.yaml"}), std::invalid_argument);
    EXPECT_THROW(parseShareCommandArgs({"config.yaml", ""}), std::invalid_argument);
    EXPECT_THROW(parseShareCommandArgs({"a", "b", "c"}), std::invalid_argument);
}
