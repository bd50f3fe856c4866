// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef NATIVE_SHARE_CONFIG_SHARE_CONFIG_HPP
#define NATIVE_SHARE_CONFIG_SHARE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "native_share/services/ShareRequest.hpp"
#include "native_share/staging/StagingArea.hpp"

namespace native_share::config {

struct ShareConfig {
    std::string staging_root = "temp";  // "temp" or "cache"
    int worker_threads = 1;
    int64_t max_payload_bytes = 0;      // 0 = unlimited
    bool cleanup_on_startup = false;
    bool cleanup_on_shutdown = true;

    std::vector<std::string> validate() const;
};

ShareConfig loadShareConfigFromYaml(const std::string& path);
ShareConfig parseShareConfigFromYamlString(const std::string& yaml);

// Throws std::invalid_argument for an unknown root name.
staging::StagingRoot stagingRootFromString(const std::string& name);

staging::StagingAreaOptions stagingOptionsFromConfig(const ShareConfig& config);

// Request file entries carry either inline base64 `data` or a local `path`
// whose bytes are read and encoded. Relative paths resolve against the
// directory of the request file.
services::ShareRequest loadShareRequestFromYaml(const std::string& path);

}  // namespace native_share::config

#endif  // NATIVE_SHARE_CONFIG_SHARE_CONFIG_HPP
