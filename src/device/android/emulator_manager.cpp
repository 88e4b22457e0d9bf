/*
 * emulator_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Android emulator manager implementation

**************************************************/

#include "emulator_manager.hpp"

#include <algorithm>

#include "avd_config.hpp"
#include "common/preview_exceptions.hpp"
#include "common/string_utils.hpp"
#include "common/version.hpp"

namespace devpreview::device::android {

namespace {

constexpr std::string_view kSerialPrefix = "emulator-";

auto serialFor(int port) -> std::string {
    return std::string(kSerialPrefix) + std::to_string(port);
}

/**
 * Numeric API levels in descending order with codenames ahead of them.
 */
auto newerApi(const std::string& a, const std::string& b) -> bool {
    auto va = Version::parse(a);
    auto vb = Version::parse(b);
    if (va && vb) {
        return *vb < *va;
    }
    if (!va && !vb) {
        return a > b;
    }
    return !va;
}

auto meetsMinimum(const std::string& api, const std::string& minimum) -> bool {
    try {
        return Version::sameOrNewer(api, minimum);
    } catch (const UnsupportedComparisonError&) {
        return false;
    }
}

auto supportedApis(const parser::PackageCatalog& catalog,
                   const config::AndroidSettings& settings)
    -> std::vector<std::string> {
    std::vector<std::string> apis;
    for (const auto& platform : catalog.platforms()) {
        auto api = platform.apiLevel();
        if (!api.empty() && meetsMinimum(api, settings.minimumApiLevel) &&
            std::find(apis.begin(), apis.end(), api) == apis.end()) {
            apis.push_back(std::move(api));
        }
    }
    std::sort(apis.begin(), apis.end(), newerApi);
    return apis;
}

auto firstLine(const std::string& text) -> std::string {
    for (auto line : utils::splitLines(text)) {
        auto trimmed = utils::trim(line);
        if (!trimmed.empty()) {
            return std::string(trimmed);
        }
    }
    return {};
}

}  // namespace

auto selectPlatformApi(const parser::PackageCatalog& catalog,
                       const config::AndroidSettings& settings)
    -> PreviewResult<std::string> {
    auto apis = supportedApis(catalog, settings);
    if (apis.empty()) {
        return failure(PreviewErrorCode::ToolchainMissing,
                       "No Android platform at API level " +
                           settings.minimumApiLevel + " or newer is installed");
    }
    return apis.front();
}

auto selectEmulatorImage(const parser::PackageCatalog& catalog,
                         const config::AndroidSettings& settings)
    -> PreviewResult<EmulatorImage> {
    auto images = catalog.systemImages();
    for (const auto& api : supportedApis(catalog, settings)) {
        for (const auto& tag : settings.supportedImages) {
            for (const auto& abi : settings.supportedAbis) {
                auto it = std::find_if(
                    images.begin(), images.end(), [&](const auto& image) {
                        return image.apiLevel() == api && image.tag() == tag &&
                               image.abi() == abi;
                    });
                if (it != images.end()) {
                    return EmulatorImage{api, tag, abi, it->path};
                }
            }
        }
    }
    return failure(PreviewErrorCode::ToolchainMissing,
                   "No supported emulator image is installed");
}

EmulatorManager::EmulatorManager(std::shared_ptr<process::ProcessRunner> runner,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<spdlog::logger> logger,
                                 config::AndroidSettings settings)
    : runner_(std::move(runner)),
      logger_(logger),
      settings_(std::move(settings)),
      sdkRoot_(settings_.resolveSdkRoot()),
      ports_(settings_.firstEmulatorPort, settings_.lastEmulatorPort),
      poller_(std::move(clock), std::move(logger), settings_.bootPoll) {}

auto EmulatorManager::toolPath(AndroidTool tool) const
    -> std::filesystem::path {
    std::filesystem::path relative;
    std::string name;
    switch (tool) {
        case AndroidTool::SdkManager:
            relative = "cmdline-tools/latest/bin";
            name = "sdkmanager";
            break;
        case AndroidTool::AvdManager:
            relative = "cmdline-tools/latest/bin";
            name = "avdmanager";
            break;
        case AndroidTool::Adb:
            relative = "platform-tools";
            name = "adb";
            break;
        case AndroidTool::Emulator:
            relative = "emulator";
            name = "emulator";
            break;
    }
    if (sdkRoot_.empty()) {
        return name;
    }
    return std::filesystem::path(sdkRoot_) / relative / name;
}

auto EmulatorManager::adb(int port) const -> process::CommandBuilder {
    process::CommandBuilder builder(toolPath(AndroidTool::Adb).string());
    builder.addOption("-s", serialFor(port));
    return builder;
}

auto EmulatorManager::listPackages() -> PreviewResult<parser::PackageCatalog> {
    auto config =
        process::CommandBuilder(toolPath(AndroidTool::SdkManager).string())
            .addFlag("--list")
            .build();
    auto result = process::runChecked(*runner_, config,
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parser::parsePackageCatalog(result->stdOut, true);
}

auto EmulatorManager::findEmulatorImage() -> PreviewResult<EmulatorImage> {
    auto catalog = listPackages();
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    auto image = selectEmulatorImage(*catalog, settings_);
    if (image) {
        logger_->debug("Selected emulator image {}", image->packagePath);
    }
    return image;
}

auto EmulatorManager::listAvds()
    -> PreviewResult<std::vector<parser::AvdDescriptor>> {
    auto config =
        process::CommandBuilder(toolPath(AndroidTool::AvdManager).string())
            .addArg("list")
            .addArg("avd")
            .build();
    auto result = process::runChecked(*runner_, config,
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parser::parseAvdList(result->stdOut);
}

auto EmulatorManager::listEmulatorNames()
    -> PreviewResult<std::vector<std::string>> {
    auto config =
        process::CommandBuilder(toolPath(AndroidTool::Emulator).string())
            .addFlag("-list-avds")
            .build();
    auto result = process::runChecked(*runner_, config,
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parser::parseNameList(result->stdOut);
}

auto EmulatorManager::supportedDeviceProfile() -> PreviewResult<std::string> {
    auto config =
        process::CommandBuilder(toolPath(AndroidTool::AvdManager).string())
            .addArg("list")
            .addArg("device")
            .addFlag("-c")
            .build();
    auto result = process::runChecked(*runner_, config,
                                      PreviewErrorCode::ToolchainMissing);
    if (!result) {
        return std::unexpected(result.error());
    }
    auto profiles = parser::parseNameList(result->stdOut);
    if (profiles.empty()) {
        return failure(PreviewErrorCode::ToolchainMissing,
                       "avdmanager reported no device profiles");
    }
    for (const auto& prefix : settings_.preferredDeviceProfiles) {
        auto it = std::find_if(profiles.begin(), profiles.end(),
                               [&prefix](const auto& profile) {
                                   return utils::toLower(profile).starts_with(
                                       utils::toLower(prefix));
                               });
        if (it != profiles.end()) {
            return *it;
        }
    }
    return profiles.front();
}

auto EmulatorManager::find(const std::string& name)
    -> PreviewResult<std::optional<DeviceDescriptor>> {
    auto avds = listAvds();
    if (!avds) {
        return std::unexpected(avds.error());
    }
    auto it = std::find_if(avds->begin(), avds->end(),
                           [&name](const auto& avd) { return avd.name == name; });
    if (it == avds->end()) {
        return std::optional<DeviceDescriptor>{};
    }

    auto running = runningEmulators();
    if (!running) {
        return std::unexpected(running.error());
    }
    bool isRunning = std::any_of(
        running->begin(), running->end(),
        [&name](const auto& emulator) { return emulator.avdName == name; });

    DeviceDescriptor descriptor;
    descriptor.name = it->name;
    descriptor.identifier = it->name;
    descriptor.state = isRunning ? DeviceState::Booted : DeviceState::Shutdown;
    descriptor.runtimeLabel = it->basedOn;
    return std::optional<DeviceDescriptor>{std::move(descriptor)};
}

auto EmulatorManager::create(const std::string& name,
                             const EmulatorImage& image,
                             const std::string& deviceProfile)
    -> PreviewVoidResult {
    logger_->info("Creating emulator {} from {} ({})", name, image.packagePath,
                  deviceProfile);
    auto config =
        process::CommandBuilder(toolPath(AndroidTool::AvdManager).string())
            .addArg("create")
            .addArg("avd")
            .addOption("-n", name)
            .addFlag("--force")
            .addOption("-k", image.packagePath)
            .addOption("--device", deviceProfile)
            .addOption("--abi", image.tag + "/" + image.abi)
            .withInput("no")
            .mergeStderr()
            .build();
    auto result =
        process::runChecked(*runner_, config, PreviewErrorCode::DeviceCreation);
    if (!result) {
        logger_->error("Emulator creation failed: {}",
                       result.error().toString());
        return std::unexpected(result.error());
    }

    auto avds = listAvds();
    if (!avds) {
        return std::unexpected(avds.error());
    }
    auto it = std::find_if(avds->begin(), avds->end(),
                           [&name](const auto& avd) { return avd.name == name; });
    if (it == avds->end() || it->path.empty()) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "Created emulator " + name + " is not listed by avdmanager");
    }
    return patchAvdConfig(std::filesystem::path(it->path) / "config.ini",
                          defaultAvdOverrides());
}

auto EmulatorManager::findOrCreate(const std::string& name)
    -> PreviewVoidResult {
    auto names = listEmulatorNames();
    if (!names) {
        return std::unexpected(names.error());
    }
    if (std::find(names->begin(), names->end(), name) != names->end()) {
        logger_->info("Found emulator {}", name);
        return success();
    }

    auto image = findEmulatorImage();
    if (!image) {
        return std::unexpected(image.error());
    }
    auto profile = supportedDeviceProfile();
    if (!profile) {
        return std::unexpected(profile.error());
    }
    return create(name, *image, *profile);
}

auto EmulatorManager::runningEmulators()
    -> PreviewResult<std::vector<RunningEmulator>> {
    auto devices = process::runChecked(
        *runner_,
        process::CommandBuilder(toolPath(AndroidTool::Adb).string())
            .addArg("devices")
            .build(),
        PreviewErrorCode::ToolchainMissing);
    if (!devices) {
        return std::unexpected(devices.error());
    }

    std::vector<RunningEmulator> emulators;
    for (int port : parser::parseAdbDevices(devices->stdOut)) {
        RunningEmulator emulator{serialFor(port), port, {}};
        auto name = process::runChecked(
            *runner_, adb(port).addArg("emu").addArg("avd").addArg("name").build(),
            PreviewErrorCode::CommandFailed);
        if (name) {
            emulator.avdName = firstLine(name->stdOut);
        } else {
            logger_->debug("{} did not report its AVD name: {}",
                           emulator.serial, name.error().message);
        }
        emulators.push_back(std::move(emulator));
    }
    return emulators;
}

auto EmulatorManager::start(const std::string& name) -> PreviewResult<int> {
    auto running = runningEmulators();
    if (!running) {
        return std::unexpected(running.error());
    }
    auto existing =
        std::find_if(running->begin(), running->end(),
                     [&name](const auto& e) { return e.avdName == name; });
    if (existing != running->end()) {
        logger_->info("Emulator {} is already running on port {}", name,
                      existing->port);
        return existing->port;
    }

    std::vector<int> busy;
    for (const auto& emulator : *running) {
        busy.push_back(emulator.port);
    }
    auto requested = ports_.allocate(busy);
    if (!requested) {
        return std::unexpected(requested.error());
    }

    auto config =
        process::CommandBuilder(toolPath(AndroidTool::Emulator).string())
            .addArg("@" + name)
            .addOption("-port", std::to_string(*requested))
            .build();
    auto pid = runner_->spawnDetached(config);
    if (!pid) {
        return failure(PreviewErrorCode::Launch,
                       "Failed to start emulator " + name,
                       process::processErrorToString(pid.error()));
    }
    logger_->info("Started emulator {} (pid {}) on port {}", name, *pid,
                  *requested);

    int actualPort = *requested;
    auto reported = poller_.waitUntil(
        [this, &name, &actualPort]() -> PreviewResult<bool> {
            auto current = runningEmulators();
            if (!current) {
                return std::unexpected(current.error());
            }
            for (const auto& emulator : *current) {
                if (emulator.avdName == name) {
                    actualPort = emulator.port;
                    return true;
                }
            }
            return false;
        },
        "emulator " + name + " to register with adb");
    if (!reported) {
        return std::unexpected(reported.error());
    }
    if (actualPort != *requested) {
        logger_->warn("Emulator {} requested port {} but runs on {}", name,
                      *requested, actualPort);
    }
    return actualPort;
}

auto EmulatorManager::waitForBoot(int port) -> PreviewVoidResult {
    return poller_.waitUntil(
        [this, port]() -> PreviewResult<bool> {
            auto result = process::runChecked(
                *runner_,
                adb(port)
                    .addArg("shell")
                    .addArg("getprop")
                    .addArg("sys.boot_completed")
                    .build(),
                PreviewErrorCode::CommandFailed);
            if (!result) {
                return std::unexpected(result.error());
            }
            return firstLine(result->stdOut) == "1";
        },
        serialFor(port));
}

auto EmulatorManager::boot(const std::string& name, bool waitForBootCompletion)
    -> PreviewResult<int> {
    auto port = start(name);
    if (!port) {
        return std::unexpected(port.error());
    }
    if (waitForBootCompletion) {
        auto booted = waitForBoot(*port);
        if (!booted) {
            return std::unexpected(booted.error());
        }
    }
    return port;
}

auto EmulatorManager::stop(int port) -> PreviewVoidResult {
    auto result = process::runChecked(*runner_,
                                      adb(port).addArg("emu").addArg("kill").build(),
                                      PreviewErrorCode::CommandFailed);
    if (!result) {
        return std::unexpected(result.error());
    }
    logger_->info("Stopped {}", serialFor(port));
    return success();
}

auto EmulatorManager::openUrl(int port, const std::string& url)
    -> PreviewVoidResult {
    logger_->info("Opening {} on {}", url, serialFor(port));
    auto config = adb(port)
                      .addArg("shell")
                      .addArg("am")
                      .addArg("start")
                      .addOption("-a", "android.intent.action.VIEW")
                      .addOption("-d", url)
                      .build();
    auto result =
        process::runChecked(*runner_, config, PreviewErrorCode::Launch);
    if (!result) {
        return std::unexpected(result.error());
    }
    return success();
}

auto EmulatorManager::launchApp(
    int port, const std::optional<std::string>& apkPath,
    const std::string& packageName, const std::string& activity,
    const std::vector<preview::LaunchArgument>& arguments)
    -> PreviewVoidResult {
    if (apkPath) {
        logger_->info("Installing {} on {}", *apkPath, serialFor(port));
        auto installed = process::runChecked(
            *runner_,
            adb(port).addArg("install").addFlag("-r").addFlag("-t").addArg(
                *apkPath).build(),
            PreviewErrorCode::Launch);
        if (!installed) {
            return std::unexpected(installed.error());
        }
    }

    auto builder = adb(port);
    builder.addArg("shell")
        .addArg("am")
        .addArg("start")
        .addFlag("-S")
        .addOption("-n", packageName + "/" + activity)
        .addOption("-a", "android.intent.action.MAIN")
        .addOption("-c", "android.intent.category.LAUNCHER");
    for (const auto& arg : arguments) {
        builder.addArg("--es").addArg(arg.name).addArg(arg.value);
    }

    logger_->info("Launching {} on {}", packageName, serialFor(port));
    auto launched =
        process::runChecked(*runner_, builder.build(), PreviewErrorCode::Launch);
    if (!launched) {
        return std::unexpected(launched.error());
    }
    return success();
}

}  // namespace devpreview::device::android
