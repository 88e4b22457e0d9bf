/*
 * common_requirements.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "common_requirements.hpp"

namespace devpreview::requirements {

ServerPluginRequirement::ServerPluginRequirement(
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<spdlog::logger> logger, config::ServerSettings settings)
    : runner_(std::move(runner)),
      logger_(std::move(logger)),
      settings_(std::move(settings)) {}

auto ServerPluginRequirement::title() const -> std::string {
    return "Local Development Server Plugin";
}

auto ServerPluginRequirement::isInstalled() -> bool {
    auto config = process::CommandBuilder(settings_.cliExecutable)
                      .addArg("plugins")
                      .addFlag("--core")
                      .build();
    auto result = process::runChecked(*runner_, config,
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        logger_->debug("Listing plugins failed: {}",
                       result.error().toString());
        return false;
    }
    return result->stdOut.find(settings_.pluginName) != std::string::npos;
}

auto ServerPluginRequirement::check() -> PreviewResult<std::string> {
    if (isInstalled()) {
        logger_->info("{} detected", settings_.pluginName);
        return "Local development server plugin is installed.";
    }

    logger_->info("{} was not detected, installing it", settings_.pluginName);
    auto config = process::CommandBuilder(settings_.cliExecutable)
                      .addArg("plugins:install")
                      .addArg(settings_.pluginName)
                      .mergeStderr()
                      .build();
    auto installed = process::runChecked(*runner_, config,
                                         PreviewErrorCode::ToolchainMissing);
    if (!installed) {
        logger_->error("Installing {} failed: {}", settings_.pluginName,
                       installed.error().toString());
        return failure(PreviewErrorCode::ToolchainMissing,
                       "Local development server plugin is not installed "
                       "and could not be installed.",
                       installed.error().details.value_or(""));
    }
    logger_->info("{} installed", settings_.pluginName);
    return "Local development server plugin is installed.";
}

}  // namespace devpreview::requirements
