/*
 * ios_requirements.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: iOS environment requirements

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_IOS_REQUIREMENTS_HPP
#define DEVPREVIEW_REQUIREMENTS_IOS_REQUIREMENTS_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "device/ios/simulator_manager.hpp"
#include "process/process_runner.hpp"
#include "requirement.hpp"

namespace devpreview::requirements {

/**
 * @brief Host runs macOS (`uname` reports Darwin)
 */
class SupportedOsRequirement final : public Requirement {
public:
    SupportedOsRequirement(std::shared_ptr<process::ProcessRunner> runner,
                           std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    std::shared_ptr<process::ProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Xcode command line tooling responds to `xcodebuild -version`
 */
class XcodeInstalledRequirement final : public Requirement {
public:
    XcodeInstalledRequirement(std::shared_ptr<process::ProcessRunner> runner,
                              std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto supplementalMessage() const
        -> std::optional<std::string> override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    std::shared_ptr<process::ProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief At least one simulator runtime at or above the minimum version
 */
class SimulatorRuntimeRequirement final : public Requirement {
public:
    SimulatorRuntimeRequirement(
        std::shared_ptr<device::ios::SimulatorManager> simulators,
        std::shared_ptr<spdlog::logger> logger, std::string minimumVersion);

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    std::shared_ptr<device::ios::SimulatorManager> simulators_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string minimumVersion_;
};

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_IOS_REQUIREMENTS_HPP
