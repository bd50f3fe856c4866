// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_CONFIG_CLI_CONFIG_PARSER_HPP
#define NATIVE_SHARE_CONFIG_CLI_CONFIG_PARSER_HPP

#include <string>
#include <vector>

namespace native_share::config {

struct ShareCommandArgs {
    std::string config_path;
    std::string request_path;
};

std::string parseConfigPath(const std::vector<std::string>& args);
ShareCommandArgs parseShareCommandArgs(const std::vector<std::string>& args);

}  // namespace native_share::config

#endif  // NATIVE_SHARE_CONFIG_CLI_CONFIG_PARSER_HPP
