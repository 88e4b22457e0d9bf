/*
 * ios_requirements.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "ios_requirements.hpp"

#include "common/string_utils.hpp"

namespace devpreview::requirements {

SupportedOsRequirement::SupportedOsRequirement(
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<spdlog::logger> logger)
    : runner_(std::move(runner)), logger_(std::move(logger)) {}

auto SupportedOsRequirement::title() const -> std::string {
    return "macOS Environment";
}

auto SupportedOsRequirement::check() -> PreviewResult<std::string> {
    auto result = process::runChecked(
        *runner_, process::CommandBuilder("uname").build(),
        PreviewErrorCode::UnsupportedEnvironment);
    if (!result) {
        return std::unexpected(result.error());
    }
    auto os = utils::trim(result->stdOut);
    logger_->debug("uname reported {}", os);
    if (os != "Darwin") {
        return failure(PreviewErrorCode::UnsupportedEnvironment,
                       "iOS development requires macOS, found " +
                           std::string(os) + ".");
    }
    return "Running on macOS.";
}

XcodeInstalledRequirement::XcodeInstalledRequirement(
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<spdlog::logger> logger)
    : runner_(std::move(runner)), logger_(std::move(logger)) {}

auto XcodeInstalledRequirement::title() const -> std::string {
    return "Xcode Installed";
}

auto XcodeInstalledRequirement::supplementalMessage() const
    -> std::optional<std::string> {
    return "Install Xcode and run `xcode-select --install` if it is missing.";
}

auto XcodeInstalledRequirement::check() -> PreviewResult<std::string> {
    auto result = process::runChecked(*runner_,
                                      process::CommandBuilder("xcodebuild")
                                          .addFlag("-version")
                                          .mergeStderr()
                                          .build(),
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        logger_->debug("xcodebuild failed: {}", result.error().toString());
        return failure(PreviewErrorCode::ToolchainMissing,
                       "Xcode is not installed.",
                       result.error().details.value_or(""));
    }
    auto lines = utils::splitLines(result->stdOut);
    auto version = std::string(utils::trim(lines.front()));
    return "Xcode found: " + version + ".";
}

SimulatorRuntimeRequirement::SimulatorRuntimeRequirement(
    std::shared_ptr<device::ios::SimulatorManager> simulators,
    std::shared_ptr<spdlog::logger> logger, std::string minimumVersion)
    : simulators_(std::move(simulators)),
      logger_(std::move(logger)),
      minimumVersion_(std::move(minimumVersion)) {}

auto SimulatorRuntimeRequirement::title() const -> std::string {
    return "Supported iOS Simulator Runtime";
}

auto SimulatorRuntimeRequirement::check() -> PreviewResult<std::string> {
    auto runtimes = simulators_->supportedRuntimes();
    if (!runtimes) {
        return std::unexpected(runtimes.error());
    }
    if (runtimes->empty()) {
        return failure(PreviewErrorCode::ToolchainMissing,
                       "No iOS simulator runtime " + minimumVersion_ +
                           " or newer is installed.");
    }

    std::string names;
    for (const auto& runtime : *runtimes) {
        if (!names.empty()) {
            names += ", ";
        }
        names += runtime.name;
    }
    logger_->debug("Supported runtimes: {}", names);
    return "Supported simulator runtime(s): " + names + ".";
}

}  // namespace devpreview::requirements
