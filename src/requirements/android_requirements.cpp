/*
 * android_requirements.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "android_requirements.hpp"

#include <filesystem>

#include "common/string_utils.hpp"

namespace devpreview::requirements {

auto SdkRootRequirement::title() const -> std::string {
    return "Android SDK Root";
}

auto SdkRootRequirement::supplementalMessage() const
    -> std::optional<std::string> {
    return "Set ANDROID_HOME to the Android SDK installation directory.";
}

auto SdkRootRequirement::check() -> PreviewResult<std::string> {
    const auto& root = emulators_->sdkRoot();
    if (root.empty()) {
        return failure(PreviewErrorCode::ToolchainMissing,
                       "Android SDK root is not set.");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return failure(PreviewErrorCode::ToolchainMissing,
                       "Android SDK root does not exist: " + root + ".");
    }
    logger_->debug("Android SDK root: {}", root);
    return "Android SDK root: " + root + ".";
}

ToolVersionRequirement::ToolVersionRequirement(
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<device::android::EmulatorManager> emulators,
    std::shared_ptr<spdlog::logger> logger, device::android::AndroidTool tool,
    std::string title)
    : AndroidRequirement(std::move(emulators), std::move(logger)),
      runner_(std::move(runner)),
      tool_(tool),
      title_(std::move(title)) {}

auto ToolVersionRequirement::check() -> PreviewResult<std::string> {
    auto path = emulators_->toolPath(tool_);
    auto result = process::runChecked(
        *runner_,
        process::CommandBuilder(path.string()).addFlag("--version").build(),
        PreviewErrorCode::ToolchainMissing);
    if (!result) {
        logger_->debug("{} --version failed: {}", path.string(),
                       result.error().toString());
        return failure(PreviewErrorCode::ToolchainMissing,
                       path.filename().string() + " is not installed.",
                       result.error().details.value_or(""));
    }
    auto lines = utils::splitLines(result->stdOut);
    return path.filename().string() + " found: " +
           std::string(utils::trim(lines.front())) + ".";
}

PlatformApiRequirement::PlatformApiRequirement(
    std::shared_ptr<device::android::EmulatorManager> emulators,
    std::shared_ptr<spdlog::logger> logger, config::AndroidSettings settings)
    : AndroidRequirement(std::move(emulators), std::move(logger)),
      settings_(std::move(settings)) {}

auto PlatformApiRequirement::title() const -> std::string {
    return "Supported Android Platform API";
}

auto PlatformApiRequirement::check() -> PreviewResult<std::string> {
    auto catalog = emulators_->listPackages();
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    auto api = device::android::selectPlatformApi(*catalog, settings_);
    if (!api) {
        return std::unexpected(api.error());
    }
    return "Android API level " + *api + " is installed.";
}

auto EmulatorImageRequirement::title() const -> std::string {
    return "Supported Android Emulator Image";
}

auto EmulatorImageRequirement::supplementalMessage() const
    -> std::optional<std::string> {
    return "Install a system image with `sdkmanager \"system-images;"
           "android-<api>;google_apis;<abi>\"`.";
}

auto EmulatorImageRequirement::check() -> PreviewResult<std::string> {
    auto image = emulators_->findEmulatorImage();
    if (!image) {
        return std::unexpected(image.error());
    }
    return "Emulator image " + image->packagePath + " is installed.";
}

}  // namespace devpreview::requirements
