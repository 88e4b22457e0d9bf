/*
 * simulator_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: iOS simulator discovery, creation, boot and app control via
xcrun simctl

**************************************************/

#ifndef DEVPREVIEW_DEVICE_IOS_SIMULATOR_MANAGER_HPP
#define DEVPREVIEW_DEVICE_IOS_SIMULATOR_MANAGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "common/preview_result.hpp"
#include "config/settings.hpp"
#include "device/boot_poller.hpp"
#include "device/device_types.hpp"
#include "parser/simulator_parser.hpp"
#include "preview/preview_config.hpp"
#include "process/process_runner.hpp"

namespace devpreview::device::ios {

class SimulatorManager {
public:
    SimulatorManager(std::shared_ptr<process::ProcessRunner> runner,
                     std::shared_ptr<Clock> clock,
                     std::shared_ptr<spdlog::logger> logger,
                     config::IosSettings settings);

    /**
     * @brief Available iOS runtimes at or above the configured minimum,
     * newest first
     */
    [[nodiscard]] auto supportedRuntimes()
        -> PreviewResult<std::vector<parser::SimulatorRuntime>>;

    /**
     * @brief Device type identifiers of the configured family
     */
    [[nodiscard]] auto supportedDeviceTypes()
        -> PreviewResult<std::vector<parser::SimulatorDeviceType>>;

    /**
     * @brief Simulators belonging to supported runtimes
     */
    [[nodiscard]] auto listDevices()
        -> PreviewResult<std::vector<DeviceDescriptor>>;

    /**
     * @brief First simulator whose name matches exactly
     */
    [[nodiscard]] auto find(const std::string& name)
        -> PreviewResult<std::optional<DeviceDescriptor>>;

    /**
     * @brief Create a simulator; never retried
     * @return UDID of the new simulator, or DeviceCreation
     */
    [[nodiscard]] auto create(const std::string& name,
                              const std::string& deviceType,
                              const std::string& runtime)
        -> PreviewResult<std::string>;

    /**
     * @brief Find the named simulator or create it from the newest
     * supported runtime and the first supported device type
     * @return UDID
     */
    [[nodiscard]] auto findOrCreate(const std::string& name)
        -> PreviewResult<std::string>;

    /**
     * @brief Boot a simulator. Already booted simulators succeed without a
     * boot command.
     */
    [[nodiscard]] auto boot(const std::string& udid, bool waitForBoot)
        -> PreviewVoidResult;

    [[nodiscard]] auto shutdown(const std::string& udid) -> PreviewVoidResult;

    /**
     * @brief Bring the Simulator application to the foreground
     */
    [[nodiscard]] auto launchSimulatorApp() -> PreviewVoidResult;

    [[nodiscard]] auto openUrl(const std::string& udid, const std::string& url)
        -> PreviewVoidResult;

    /**
     * @brief Install (optional), terminate and launch an app
     */
    [[nodiscard]] auto launchApp(
        const std::string& udid, const std::optional<std::string>& bundlePath,
        const std::string& bundleId,
        const std::vector<preview::LaunchArgument>& arguments)
        -> PreviewVoidResult;

private:
    [[nodiscard]] auto simctl(std::initializer_list<std::string_view> args)
        const -> process::ProcessConfig;

    [[nodiscard]] auto deviceState(const std::string& udid)
        -> PreviewResult<DeviceState>;

    std::shared_ptr<process::ProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
    config::IosSettings settings_;
    BootPoller poller_;
};

}  // namespace devpreview::device::ios

#endif  // DEVPREVIEW_DEVICE_IOS_SIMULATOR_MANAGER_HPP
