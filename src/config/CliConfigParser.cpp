// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/config/CliConfigParser.hpp"

#include <stdexcept>

namespace native_share::config {

std::string parseConfigPath(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("Expected exactly one configuration path argument");
    }
    if (args.front().empty()) {
        throw std::invalid_argument("Configuration path must not be empty");
    }
    return args.front();
}

ShareCommandArgs parseShareCommandArgs(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        throw std::invalid_argument("Expected a configuration path and a request path");
    }
    if (args[0].empty()) {
        throw std::invalid_argument("Configuration path must not be empty");
    }
    if (args[1].empty()) {
        throw std::invalid_argument("Request path must not be empty");
    }
    return ShareCommandArgs{args[0], args[1]};
}

}  // namespace native_share::config
