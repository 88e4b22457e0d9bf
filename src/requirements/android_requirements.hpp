/*
 * android_requirements.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Android environment requirements

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_ANDROID_REQUIREMENTS_HPP
#define DEVPREVIEW_REQUIREMENTS_ANDROID_REQUIREMENTS_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "config/settings.hpp"
#include "device/android/emulator_manager.hpp"
#include "process/process_runner.hpp"
#include "requirement.hpp"

namespace devpreview::requirements {

/**
 * @brief Base for requirements that inspect the Android SDK
 */
class AndroidRequirement : public Requirement {
public:
    AndroidRequirement(
        std::shared_ptr<device::android::EmulatorManager> emulators,
        std::shared_ptr<spdlog::logger> logger)
        : emulators_(std::move(emulators)), logger_(std::move(logger)) {}

protected:
    std::shared_ptr<device::android::EmulatorManager> emulators_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief ANDROID_HOME / ANDROID_SDK_ROOT (or the configured root) points at
 * an existing directory
 */
class SdkRootRequirement final : public AndroidRequirement {
public:
    using AndroidRequirement::AndroidRequirement;

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto supplementalMessage() const
        -> std::optional<std::string> override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;
};

/**
 * @brief A tool answers `<tool> --version`
 */
class ToolVersionRequirement final : public AndroidRequirement {
public:
    ToolVersionRequirement(
        std::shared_ptr<process::ProcessRunner> runner,
        std::shared_ptr<device::android::EmulatorManager> emulators,
        std::shared_ptr<spdlog::logger> logger,
        device::android::AndroidTool tool, std::string title);

    [[nodiscard]] auto title() const -> std::string override { return title_; }
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    std::shared_ptr<process::ProcessRunner> runner_;
    device::android::AndroidTool tool_;
    std::string title_;
};

/**
 * @brief A platform at the minimum API level or newer is installed
 */
class PlatformApiRequirement final : public AndroidRequirement {
public:
    PlatformApiRequirement(
        std::shared_ptr<device::android::EmulatorManager> emulators,
        std::shared_ptr<spdlog::logger> logger,
        config::AndroidSettings settings);

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    config::AndroidSettings settings_;
};

/**
 * @brief A system image usable to create an emulator is installed
 */
class EmulatorImageRequirement final : public AndroidRequirement {
public:
    using AndroidRequirement::AndroidRequirement;

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto supplementalMessage() const
        -> std::optional<std::string> override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;
};

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_ANDROID_REQUIREMENTS_HPP
