// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/config/ShareConfig.hpp"

#include "native_share/common/Base64.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace native_share::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    YAML::Node node = root;
    if (root["native_share"]) {
        node = root["native_share"];
    }
    if (node["parameters"]) {
        return node["parameters"];
    }
    return node;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

std::optional<std::string> readOptional(const YAML::Node& node, const std::string& key) {
    if (!node || !node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<std::string>();
}

ShareConfig parseShareConfig(const YAML::Node& params) {
    ShareConfig config;
    config.staging_root = readOrDefault<std::string>(params, "staging_root", config.staging_root);
    config.worker_threads = readOrDefault<int>(params, "worker_threads", config.worker_threads);
    config.max_payload_bytes =
        readOrDefault<int64_t>(params, "max_payload_bytes", config.max_payload_bytes);
    config.cleanup_on_startup =
        readOrDefault<bool>(params, "cleanup_on_startup", config.cleanup_on_startup);
    config.cleanup_on_shutdown =
        readOrDefault<bool>(params, "cleanup_on_shutdown", config.cleanup_on_shutdown);
    return config;
}

std::string readFileAsBase64(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    return common::encodeBase64(bytes);
}

services::SharedFile parseSharedFile(const YAML::Node& node,
                                     const std::filesystem::path& base_dir) {
    services::SharedFile file;
    file.name = readOrDefault<std::string>(node, "name", "");
    file.mime_type = readOrDefault<std::string>(node, "mime_type", file.mime_type);

    if (node["data"]) {
        file.data = node["data"].as<std::string>();
    } else if (node["path"]) {
        std::filesystem::path source(node["path"].as<std::string>());
        if (source.is_relative()) {
            source = base_dir / source;
        }
        file.data = readFileAsBase64(source);
        if (file.name.empty()) {
            file.name = source.filename().string();
        }
    } else {
        throw std::invalid_argument("file entry needs either 'data' or 'path'");
    }
    return file;
}

}  // namespace

ShareConfig loadShareConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    return parseShareConfig(extractParameterNode(root));
}

ShareConfig parseShareConfigFromYamlString(const std::string& yaml) {
    YAML::Node root = YAML::Load(yaml);
    return parseShareConfig(extractParameterNode(root));
}

std::vector<std::string> ShareConfig::validate() const {
    std::vector<std::string> errors;
    if (staging_root != "temp" && staging_root != "cache") {
        errors.emplace_back("staging_root must be 'temp' or 'cache', got '" + staging_root + "'");
    }
    if (worker_threads <= 0) {
        errors.emplace_back("worker_threads must be greater than zero");
    }
    if (max_payload_bytes < 0) {
        errors.emplace_back("max_payload_bytes must be non-negative");
    }
    return errors;
}

staging::StagingRoot stagingRootFromString(const std::string& name) {
    if (name == "temp") {
        return staging::StagingRoot::Temp;
    }
    if (name == "cache") {
        return staging::StagingRoot::Cache;
    }
    throw std::invalid_argument("Unknown staging root: " + name);
}

staging::StagingAreaOptions stagingOptionsFromConfig(const ShareConfig& config) {
    staging::StagingAreaOptions options;
    options.root = stagingRootFromString(config.staging_root);
    options.max_payload_bytes = config.max_payload_bytes > 0
        ? static_cast<std::uintmax_t>(config.max_payload_bytes)
        : 0;
    return options;
}

services::ShareRequest loadShareRequestFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    const auto base_dir = std::filesystem::path(path).parent_path();

    services::ShareRequest request;
    request.text = readOptional(root, "text");
    request.title = readOptional(root, "title");
    request.url = readOptional(root, "url");

    if (root["files"]) {
        const YAML::Node files = root["files"];
        if (!files.IsSequence()) {
            throw std::invalid_argument("'files' must be a list");
        }
        for (const auto& entry : files) {
            request.files.push_back(parseSharedFile(entry, base_dir));
        }
    }
    return request;
}

}  // namespace native_share::config
