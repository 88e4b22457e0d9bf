/*
 * preview_launcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Launch a component preview on a simulator or emulator

**************************************************/

#ifndef DEVPREVIEW_DEVICE_PREVIEW_LAUNCHER_HPP
#define DEVPREVIEW_DEVICE_PREVIEW_LAUNCHER_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "common/preview_result.hpp"
#include "device/android/emulator_manager.hpp"
#include "device/ios/simulator_manager.hpp"
#include "preview/preview_config.hpp"

namespace devpreview::device {

/// Host address of the development machine as seen from a simulator
inline constexpr std::string_view kIosServerAddress = "http://localhost";
/// Host address of the development machine as seen from an emulator
inline constexpr std::string_view kAndroidServerAddress = "http://10.0.2.2";

/**
 * @brief Find or create, boot, then open the preview on the target device.
 *
 * The first failing step ends the launch and its error is returned; nothing
 * already done is rolled back.
 */
class PreviewLauncher {
public:
    virtual ~PreviewLauncher() = default;

    [[nodiscard]] virtual auto launchPreview(
        const preview::PreviewRequest& request) -> PreviewVoidResult = 0;
};

class IosPreviewLauncher final : public PreviewLauncher {
public:
    IosPreviewLauncher(std::shared_ptr<ios::SimulatorManager> simulators,
                       std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto launchPreview(const preview::PreviewRequest& request)
        -> PreviewVoidResult override;

private:
    std::shared_ptr<ios::SimulatorManager> simulators_;
    std::shared_ptr<spdlog::logger> logger_;
};

class AndroidPreviewLauncher final : public PreviewLauncher {
public:
    AndroidPreviewLauncher(std::shared_ptr<android::EmulatorManager> emulators,
                           std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto launchPreview(const preview::PreviewRequest& request)
        -> PreviewVoidResult override;

private:
    std::shared_ptr<android::EmulatorManager> emulators_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace devpreview::device

#endif  // DEVPREVIEW_DEVICE_PREVIEW_LAUNCHER_HPP
