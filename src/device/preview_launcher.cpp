/*
 * preview_launcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "preview_launcher.hpp"

namespace devpreview::device {

namespace {

struct ServerEndpoint {
    std::optional<std::string> address;
    std::optional<std::string> port;
};

auto serverEndpoint(const preview::PreviewRequest& request,
                    std::string_view address) -> ServerEndpoint {
    if (!preview::useServerForPreviewing(request.targetApp,
                                         request.appConfig)) {
        return {};
    }
    return {std::string(address), request.serverPort};
}

}  // namespace

IosPreviewLauncher::IosPreviewLauncher(
    std::shared_ptr<ios::SimulatorManager> simulators,
    std::shared_ptr<spdlog::logger> logger)
    : simulators_(std::move(simulators)), logger_(std::move(logger)) {}

auto IosPreviewLauncher::launchPreview(const preview::PreviewRequest& request)
    -> PreviewVoidResult {
    logger_->info("Launching preview of {} on simulator {}",
                  request.componentName, request.deviceName);

    auto udid = simulators_->findOrCreate(request.deviceName);
    if (!udid) {
        return std::unexpected(udid.error());
    }
    if (auto booted = simulators_->boot(*udid, true); !booted) {
        return booted;
    }
    if (auto opened = simulators_->launchSimulatorApp(); !opened) {
        return opened;
    }

    auto endpoint = serverEndpoint(request, kIosServerAddress);
    if (preview::isTargetingBrowser(request.targetApp)) {
        auto url = preview::composePreviewUrl(
            endpoint.address.value_or(""), endpoint.port.value_or(""),
            request.componentName, request.targetingLwrServer);
        return simulators_->openUrl(*udid, url);
    }

    auto arguments =
        preview::buildLaunchArguments(request, endpoint.address, endpoint.port);
    return simulators_->launchApp(*udid, request.appBundlePath,
                                  request.targetApp, arguments);
}

AndroidPreviewLauncher::AndroidPreviewLauncher(
    std::shared_ptr<android::EmulatorManager> emulators,
    std::shared_ptr<spdlog::logger> logger)
    : emulators_(std::move(emulators)), logger_(std::move(logger)) {}

auto AndroidPreviewLauncher::launchPreview(
    const preview::PreviewRequest& request) -> PreviewVoidResult {
    logger_->info("Launching preview of {} on emulator {}",
                  request.componentName, request.deviceName);

    if (auto created = emulators_->findOrCreate(request.deviceName); !created) {
        return created;
    }
    auto port = emulators_->boot(request.deviceName, true);
    if (!port) {
        return std::unexpected(port.error());
    }

    auto endpoint = serverEndpoint(request, kAndroidServerAddress);
    if (preview::isTargetingBrowser(request.targetApp)) {
        auto url = preview::composePreviewUrl(
            endpoint.address.value_or(""), endpoint.port.value_or(""),
            request.componentName, false);
        return emulators_->openUrl(*port, url);
    }

    auto arguments =
        preview::buildLaunchArguments(request, endpoint.address, endpoint.port);
    std::string activity =
        request.appConfig ? request.appConfig->activity : std::string();
    return emulators_->launchApp(*port, request.appBundlePath,
                                 request.targetApp, activity, arguments);
}

}  // namespace devpreview::device
