/*
 * emulator_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Android emulator discovery, creation, start/boot and app control
through the SDK command line tools

**************************************************/

#ifndef DEVPREVIEW_DEVICE_ANDROID_EMULATOR_MANAGER_HPP
#define DEVPREVIEW_DEVICE_ANDROID_EMULATOR_MANAGER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "common/preview_result.hpp"
#include "config/settings.hpp"
#include "device/boot_poller.hpp"
#include "device/android/port_allocator.hpp"
#include "device/device_types.hpp"
#include "parser/android_parser.hpp"
#include "preview/preview_config.hpp"
#include "process/process_runner.hpp"

namespace devpreview::device::android {

enum class AndroidTool { SdkManager, AvdManager, Adb, Emulator };

/**
 * @brief Platform API and system image an emulator is created from
 */
struct EmulatorImage {
    std::string apiLevel;  ///< "30" or a codename such as "Tiramisu"
    std::string tag;       ///< "google_apis"
    std::string abi;       ///< "x86_64"
    std::string packagePath;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"apiLevel", apiLevel},
                {"tag", tag},
                {"abi", abi},
                {"packagePath", packagePath}};
    }
};

struct RunningEmulator {
    std::string serial;  ///< emulator-5554
    int port{0};
    std::string avdName;
};

/**
 * @brief Newest installed platform API at or above the configured minimum
 * @return API level, or ToolchainMissing
 */
[[nodiscard]] auto selectPlatformApi(const parser::PackageCatalog& catalog,
                                     const config::AndroidSettings& settings)
    -> PreviewResult<std::string>;

/**
 * @brief Best installed system image: newest supported API first, then the
 * configured tag and ABI preference order
 * @return Image, or ToolchainMissing
 */
[[nodiscard]] auto selectEmulatorImage(const parser::PackageCatalog& catalog,
                                       const config::AndroidSettings& settings)
    -> PreviewResult<EmulatorImage>;

class EmulatorManager {
public:
    EmulatorManager(std::shared_ptr<process::ProcessRunner> runner,
                    std::shared_ptr<Clock> clock,
                    std::shared_ptr<spdlog::logger> logger,
                    config::AndroidSettings settings);

    /**
     * @brief Location of an SDK tool; bare tool name when no SDK root is
     * known
     */
    [[nodiscard]] auto toolPath(AndroidTool tool) const
        -> std::filesystem::path;

    [[nodiscard]] auto sdkRoot() const -> const std::string& {
        return sdkRoot_;
    }

    [[nodiscard]] auto listPackages() -> PreviewResult<parser::PackageCatalog>;

    [[nodiscard]] auto findEmulatorImage() -> PreviewResult<EmulatorImage>;

    [[nodiscard]] auto listAvds()
        -> PreviewResult<std::vector<parser::AvdDescriptor>>;

    [[nodiscard]] auto listEmulatorNames()
        -> PreviewResult<std::vector<std::string>>;

    /**
     * @brief First hardware profile matching a preferred prefix, else the
     * first profile listed
     */
    [[nodiscard]] auto supportedDeviceProfile() -> PreviewResult<std::string>;

    [[nodiscard]] auto find(const std::string& name)
        -> PreviewResult<std::optional<DeviceDescriptor>>;

    /**
     * @brief Create an AVD and enable keyboard and GPU in its config.ini.
     * Never retried.
     */
    [[nodiscard]] auto create(const std::string& name,
                              const EmulatorImage& image,
                              const std::string& deviceProfile)
        -> PreviewVoidResult;

    /**
     * @brief Create the AVD unless an emulator of that name exists
     */
    [[nodiscard]] auto findOrCreate(const std::string& name)
        -> PreviewVoidResult;

    /**
     * @brief Running emulators with the AVD name each one reports
     */
    [[nodiscard]] auto runningEmulators()
        -> PreviewResult<std::vector<RunningEmulator>>;

    /**
     * @brief Start the AVD on the lowest free port, or reuse the port of an
     * instance already running it
     * @return Console port reported by the running instance
     */
    [[nodiscard]] auto start(const std::string& name) -> PreviewResult<int>;

    /**
     * @brief Poll sys.boot_completed until the emulator reports 1
     */
    [[nodiscard]] auto waitForBoot(int port) -> PreviewVoidResult;

    /**
     * @brief start() followed by waitForBoot() when requested
     */
    [[nodiscard]] auto boot(const std::string& name, bool waitForBootCompletion)
        -> PreviewResult<int>;

    [[nodiscard]] auto stop(int port) -> PreviewVoidResult;

    [[nodiscard]] auto openUrl(int port, const std::string& url)
        -> PreviewVoidResult;

    /**
     * @brief Install (optional) and launch an app with `--es` extras
     */
    [[nodiscard]] auto launchApp(
        int port, const std::optional<std::string>& apkPath,
        const std::string& packageName, const std::string& activity,
        const std::vector<preview::LaunchArgument>& arguments)
        -> PreviewVoidResult;

private:
    [[nodiscard]] auto adb(int port) const -> process::CommandBuilder;

    std::shared_ptr<process::ProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
    config::AndroidSettings settings_;
    std::string sdkRoot_;
    PortAllocator ports_;
    BootPoller poller_;
};

}  // namespace devpreview::device::android

#endif  // DEVPREVIEW_DEVICE_ANDROID_EMULATOR_MANAGER_HPP
