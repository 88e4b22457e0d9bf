/*
 * simulator_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: iOS simulator manager implementation

**************************************************/

#include "simulator_manager.hpp"

#include <algorithm>

#include "common/preview_exceptions.hpp"
#include "common/string_utils.hpp"
#include "common/version.hpp"

namespace devpreview::device::ios {

namespace {

constexpr std::string_view kXcrun = "xcrun";
constexpr std::string_view kAlreadyBooted =
    "Unable to boot device in current state: Booted";
constexpr std::string_view kAlreadyShutdown =
    "Unable to shutdown device in current state: Shutdown";

auto mentions(const PreviewError& error, std::string_view text) -> bool {
    return error.message.find(text) != std::string::npos ||
           (error.details &&
            error.details->find(text) != std::string::npos);
}

}  // namespace

SimulatorManager::SimulatorManager(
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<Clock> clock, std::shared_ptr<spdlog::logger> logger,
    config::IosSettings settings)
    : runner_(std::move(runner)),
      logger_(logger),
      settings_(std::move(settings)),
      poller_(std::move(clock), std::move(logger), settings_.bootPoll) {}

auto SimulatorManager::simctl(std::initializer_list<std::string_view> args)
    const -> process::ProcessConfig {
    process::CommandBuilder builder(kXcrun);
    builder.addArg("simctl");
    for (auto arg : args) {
        builder.addArg(arg);
    }
    return builder.mergeStderr().build();
}

auto SimulatorManager::supportedRuntimes()
    -> PreviewResult<std::vector<parser::SimulatorRuntime>> {
    auto result =
        process::runChecked(*runner_, simctl({"list", "--json", "runtimes"}),
                            PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    auto runtimes = parser::parseSimulatorRuntimes(result->stdOut);
    if (!runtimes) {
        return std::unexpected(runtimes.error());
    }

    std::vector<parser::SimulatorRuntime> supported;
    for (auto& runtime : *runtimes) {
        if (!runtime.isAvailable || !utils::iequals(runtime.platform, "iOS")) {
            continue;
        }
        try {
            if (Version::sameOrNewer(runtime.version,
                                     settings_.minimumRuntimeVersion)) {
                supported.push_back(std::move(runtime));
            }
        } catch (const UnsupportedComparisonError& e) {
            logger_->warn("Skipping runtime {}: {}", runtime.identifier,
                          e.what());
        }
    }

    std::stable_sort(supported.begin(), supported.end(),
                     [](const auto& a, const auto& b) {
                         auto va = Version::parse(a.version);
                         auto vb = Version::parse(b.version);
                         if (va && vb) {
                             return *vb < *va;
                         }
                         return a.version > b.version;
                     });
    logger_->debug("{} supported iOS runtime(s)", supported.size());
    return supported;
}

auto SimulatorManager::supportedDeviceTypes()
    -> PreviewResult<std::vector<parser::SimulatorDeviceType>> {
    auto result =
        process::runChecked(*runner_, simctl({"list", "--json", "devicetypes"}),
                            PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    auto types = parser::parseSimulatorDeviceTypes(result->stdOut);
    if (!types) {
        return std::unexpected(types.error());
    }

    std::vector<parser::SimulatorDeviceType> supported;
    std::copy_if(types->begin(), types->end(), std::back_inserter(supported),
                 [this](const auto& type) {
                     return utils::iequals(type.productFamily,
                                           settings_.deviceFamily) ||
                            type.name.starts_with(settings_.deviceFamily);
                 });
    return supported;
}

auto SimulatorManager::listDevices()
    -> PreviewResult<std::vector<DeviceDescriptor>> {
    auto runtimes = supportedRuntimes();
    if (!runtimes) {
        return std::unexpected(runtimes.error());
    }
    if (runtimes->empty()) {
        logger_->warn("No supported iOS runtime is installed");
        return std::vector<DeviceDescriptor>{};
    }

    std::vector<std::string> ids;
    ids.reserve(runtimes->size());
    for (const auto& runtime : *runtimes) {
        ids.push_back(runtime.shortIdentifier());
    }

    auto result = process::runChecked(
        *runner_, simctl({"list", "--json", "devices", "available"}),
        PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parser::parseSimulatorDevices(result->stdOut, ids);
}

auto SimulatorManager::find(const std::string& name)
    -> PreviewResult<std::optional<DeviceDescriptor>> {
    auto devices = listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }
    auto it = std::find_if(devices->begin(), devices->end(),
                           [&name](const auto& d) { return d.name == name; });
    if (it == devices->end()) {
        logger_->debug("Simulator {} not found", name);
        return std::optional<DeviceDescriptor>{};
    }
    return std::optional<DeviceDescriptor>{*it};
}

auto SimulatorManager::create(const std::string& name,
                              const std::string& deviceType,
                              const std::string& runtime)
    -> PreviewResult<std::string> {
    logger_->info("Creating simulator {} ({}, {})", name, deviceType, runtime);
    auto result = process::runChecked(
        *runner_, simctl({"create", name, deviceType, runtime}),
        PreviewErrorCode::DeviceCreation);
    if (!result) {
        logger_->error("Simulator creation failed: {}",
                       result.error().toString());
        return std::unexpected(result.error());
    }

    auto lines = utils::splitLines(result->stdOut);
    auto udid = std::string(utils::trim(lines.empty() ? "" : lines.front()));
    if (udid.empty()) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "simctl create did not report a UDID for " + name);
    }
    logger_->info("Created simulator {} ({})", name, udid);
    return udid;
}

auto SimulatorManager::findOrCreate(const std::string& name)
    -> PreviewResult<std::string> {
    auto existing = find(name);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (*existing) {
        logger_->info("Found simulator {} ({})", name,
                      (*existing)->identifier);
        return (*existing)->identifier;
    }

    auto runtimes = supportedRuntimes();
    if (!runtimes) {
        return std::unexpected(runtimes.error());
    }
    auto types = supportedDeviceTypes();
    if (!types) {
        return std::unexpected(types.error());
    }
    if (runtimes->empty() || types->empty()) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "No supported runtime or device type to create " +
                           name);
    }
    return create(name, types->front().identifier,
                  runtimes->front().identifier);
}

auto SimulatorManager::deviceState(const std::string& udid)
    -> PreviewResult<DeviceState> {
    auto devices = listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }
    auto it = std::find_if(devices->begin(), devices->end(),
                           [&udid](const auto& d) {
                               return d.identifier == udid;
                           });
    if (it == devices->end()) {
        return failure(PreviewErrorCode::DeviceNotFound,
                       "No simulator with UDID " + udid);
    }
    return it->state;
}

auto SimulatorManager::boot(const std::string& udid, bool waitForBoot)
    -> PreviewVoidResult {
    auto state = deviceState(udid);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (*state == DeviceState::Booted) {
        logger_->info("Simulator {} is already booted", udid);
        return success();
    }

    auto result = process::runChecked(*runner_, simctl({"boot", udid}),
                                      PreviewErrorCode::CommandFailed);
    if (!result) {
        if (!mentions(result.error(), kAlreadyBooted)) {
            logger_->error("Failed to boot simulator {}: {}", udid,
                           result.error().toString());
            return std::unexpected(result.error());
        }
        logger_->debug("Simulator {} was booted concurrently", udid);
    }

    if (!waitForBoot) {
        return success();
    }
    return poller_.waitUntil(
        [this, &udid]() -> PreviewResult<bool> {
            auto current = deviceState(udid);
            if (!current) {
                return std::unexpected(current.error());
            }
            return *current == DeviceState::Booted;
        },
        "simulator " + udid);
}

auto SimulatorManager::shutdown(const std::string& udid) -> PreviewVoidResult {
    auto result = process::runChecked(*runner_, simctl({"shutdown", udid}),
                                      PreviewErrorCode::CommandFailed);
    if (!result && !mentions(result.error(), kAlreadyShutdown)) {
        return std::unexpected(result.error());
    }
    logger_->info("Simulator {} shut down", udid);
    return success();
}

auto SimulatorManager::launchSimulatorApp() -> PreviewVoidResult {
    auto config = process::CommandBuilder("open")
                      .addOption("-a", "Simulator")
                      .mergeStderr()
                      .build();
    auto result =
        process::runChecked(*runner_, config, PreviewErrorCode::Launch);
    if (!result) {
        return std::unexpected(result.error());
    }
    return success();
}

auto SimulatorManager::openUrl(const std::string& udid, const std::string& url)
    -> PreviewVoidResult {
    logger_->info("Opening {} on simulator {}", url, udid);
    auto result = process::runChecked(*runner_, simctl({"openurl", udid, url}),
                                      PreviewErrorCode::Launch);
    if (!result) {
        return std::unexpected(result.error());
    }
    return success();
}

auto SimulatorManager::launchApp(
    const std::string& udid, const std::optional<std::string>& bundlePath,
    const std::string& bundleId,
    const std::vector<preview::LaunchArgument>& arguments)
    -> PreviewVoidResult {
    if (bundlePath) {
        logger_->info("Installing {} on simulator {}", *bundlePath, udid);
        auto installed = process::runChecked(
            *runner_, simctl({"install", udid, *bundlePath}),
            PreviewErrorCode::Launch);
        if (!installed) {
            return std::unexpected(installed.error());
        }
    }

    // Terminating an app that is not running fails; only the launch matters.
    auto terminated = process::runChecked(
        *runner_, simctl({"terminate", udid, bundleId}),
        PreviewErrorCode::CommandFailed);
    if (!terminated) {
        logger_->debug("{} was not running: {}", bundleId,
                       terminated.error().message);
    }

    auto config = simctl({"launch", udid, bundleId});
    for (const auto& arg : arguments) {
        config.arguments.push_back(arg.name + "=" + arg.value);
    }
    logger_->info("Launching {} on simulator {}", bundleId, udid);
    auto launched =
        process::runChecked(*runner_, config, PreviewErrorCode::Launch);
    if (!launched) {
        return std::unexpected(launched.error());
    }
    return success();
}

}  // namespace devpreview::device::ios
