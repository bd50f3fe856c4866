// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "native_share/common/ShareError.hpp"
#include "native_share/config/CliConfigParser.hpp"
#include "native_share/config/ShareConfig.hpp"
#include "native_share/execution/MainLoopQueue.hpp"
#include "native_share/execution/ThreadPool.hpp"
#include "native_share/presenter/ConsolePresenter.hpp"
#include "native_share/services/ShareService.hpp"
#include "native_share/staging/StagingArea.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using native_share::config::ShareConfig;
using native_share::config::loadShareConfigFromYaml;
using native_share::config::loadShareRequestFromYaml;
using native_share::config::parseConfigPath;
using native_share::config::parseShareCommandArgs;
using native_share::config::stagingOptionsFromConfig;
using native_share::services::ShareResult;
using native_share::services::ShareService;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  share <config.yaml> <request.yaml>        - Stage request files and present them\n";
    std::cout << "  cleanup <config.yaml>                     - Remove the staging directory\n";
    std::cout << "  can-share <config.yaml>                   - Report whether sharing is available\n";
}

bool loadConfig(const std::string& path, ShareConfig& config) {
    try {
        config = loadShareConfigFromYaml(path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return false;
    }

    const auto errors = config.validate();
    for (const auto& err : errors) {
        std::cerr << "Config error: " << err << "\n";
    }
    return errors.empty();
}

void printResult(const ShareResult& result) {
    if (result.success) {
        std::cout << "Share completed.\n";
    } else {
        std::cerr << "Share failed ("
                  << native_share::common::errorKindToString(result.error_kind)
                  << "): " << result.error_message << "\n";
    }
}

// Pumps the UI queue on this (main) thread until the share resolves.
ShareResult waitPumping(std::future<ShareResult>& future,
                        native_share::execution::MainLoopQueue& ui) {
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        ui.runFor(std::chrono::milliseconds(20));
    }
    return future.get();
}

int runShare(const std::vector<std::string>& args, const char* program_name) {
    native_share::config::ShareCommandArgs command_args;
    try {
        command_args = parseShareCommandArgs(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    ShareConfig config;
    if (!loadConfig(command_args.config_path, config)) {
        return 1;
    }

    native_share::services::ShareRequest request;
    try {
        request = loadShareRequestFromYaml(command_args.request_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load request: " << e.what() << "\n";
        return 1;
    }

    native_share::staging::StagingArea staging(stagingOptionsFromConfig(config));
    if (config.cleanup_on_startup) {
        try {
            staging.cleanupAll();
        } catch (const native_share::common::ShareError& e) {
            std::cerr << "Warning: Startup cleanup failed: " << e.what() << "\n";
        }
    }

    native_share::execution::ThreadPool worker(static_cast<std::size_t>(config.worker_threads));
    native_share::execution::MainLoopQueue ui;
    auto presenter = std::make_shared<native_share::presenter::ConsolePresenter>(std::cout);
    ShareService service(staging, presenter, worker, ui);

    auto future = service.share(std::move(request));
    const ShareResult result = waitPumping(future, ui);
    worker.shutdown();

    if (config.cleanup_on_shutdown) {
        staging.releaseTrackedFiles();
    }

    printResult(result);
    return result.success ? 0 : 1;
}

int runCleanup(const std::vector<std::string>& args, const char* program_name) {
    std::string config_path;
    try {
        config_path = parseConfigPath(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    ShareConfig config;
    if (!loadConfig(config_path, config)) {
        return 1;
    }

    native_share::staging::StagingArea staging(stagingOptionsFromConfig(config));
    try {
        staging.cleanupAll();
    } catch (const native_share::common::ShareError& e) {
        std::cerr << "Cleanup failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Staging directory removed: " << staging.stagingDirectory().string() << "\n";
    return 0;
}

int runCanShare(const std::vector<std::string>& args, const char* program_name) {
    std::string config_path;
    try {
        config_path = parseConfigPath(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(program_name);
        return 1;
    }

    ShareConfig config;
    if (!loadConfig(config_path, config)) {
        return 1;
    }

    native_share::presenter::ConsolePresenter presenter(std::cout);
    std::cout << "Can share: " << (presenter.isAvailable() ? "yes" : "no") << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "share") {
            return runShare(args, argv[0]);
        }
        if (command == "cleanup") {
            return runCleanup(args, argv[0]);
        }
        if (command == "can-share") {
            return runCanShare(args, argv[0]);
        }

        std::cerr << "Error: Unknown command '" << command << "'\n";
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
