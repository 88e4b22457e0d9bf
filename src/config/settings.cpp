/*
 * settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings.hpp"

#include <cstdlib>
#include <fstream>

namespace devpreview::config {

namespace {

auto getEnv(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

}  // namespace

auto IosSettings::toJson() const -> json {
    return {{"minimumRuntimeVersion", minimumRuntimeVersion},
            {"deviceFamily", deviceFamily},
            {"bootPoll", bootPoll.toJson()}};
}

auto IosSettings::fromJson(const json& j) -> IosSettings {
    IosSettings s;
    s.minimumRuntimeVersion =
        j.value("minimumRuntimeVersion", s.minimumRuntimeVersion);
    s.deviceFamily = j.value("deviceFamily", s.deviceFamily);
    if (j.contains("bootPoll")) {
        s.bootPoll = device::BootPollPolicy::fromJson(j["bootPoll"]);
    }
    return s;
}

auto AndroidSettings::resolveSdkRoot() const -> std::string {
    if (!sdkRoot.empty()) {
        return sdkRoot;
    }
    if (auto home = getEnv("ANDROID_HOME"); !home.empty()) {
        return home;
    }
    return getEnv("ANDROID_SDK_ROOT");
}

auto AndroidSettings::toJson() const -> json {
    return {{"sdkRoot", sdkRoot},
            {"minimumApiLevel", minimumApiLevel},
            {"supportedImages", supportedImages},
            {"supportedAbis", supportedAbis},
            {"preferredDeviceProfiles", preferredDeviceProfiles},
            {"firstEmulatorPort", firstEmulatorPort},
            {"lastEmulatorPort", lastEmulatorPort},
            {"bootPoll", bootPoll.toJson()}};
}

auto AndroidSettings::fromJson(const json& j) -> AndroidSettings {
    AndroidSettings s;
    s.sdkRoot = j.value("sdkRoot", s.sdkRoot);
    s.minimumApiLevel = j.value("minimumApiLevel", s.minimumApiLevel);
    s.supportedImages = j.value("supportedImages", s.supportedImages);
    s.supportedAbis = j.value("supportedAbis", s.supportedAbis);
    s.preferredDeviceProfiles =
        j.value("preferredDeviceProfiles", s.preferredDeviceProfiles);
    s.firstEmulatorPort = j.value("firstEmulatorPort", s.firstEmulatorPort);
    s.lastEmulatorPort = j.value("lastEmulatorPort", s.lastEmulatorPort);
    if (j.contains("bootPoll")) {
        s.bootPoll = device::BootPollPolicy::fromJson(j["bootPoll"]);
    }
    return s;
}

auto ServerSettings::toJson() const -> json {
    return {{"cliExecutable", cliExecutable},
            {"pluginName", pluginName},
            {"defaultPort", defaultPort}};
}

auto ServerSettings::fromJson(const json& j) -> ServerSettings {
    ServerSettings s;
    s.cliExecutable = j.value("cliExecutable", s.cliExecutable);
    s.pluginName = j.value("pluginName", s.pluginName);
    s.defaultPort = j.value("defaultPort", s.defaultPort);
    return s;
}

auto PreviewSettings::toJson() const -> json {
    return {{"logging", logging.toJson()},
            {"ios", ios.toJson()},
            {"android", android.toJson()},
            {"server", server.toJson()}};
}

auto PreviewSettings::fromJson(const json& j) -> PreviewSettings {
    PreviewSettings s;
    if (j.contains("logging")) {
        s.logging = logging::LoggingConfig::fromJson(j["logging"]);
    }
    if (j.contains("ios")) {
        s.ios = IosSettings::fromJson(j["ios"]);
    }
    if (j.contains("android")) {
        s.android = AndroidSettings::fromJson(j["android"]);
    }
    if (j.contains("server")) {
        s.server = ServerSettings::fromJson(j["server"]);
    }
    return s;
}

auto loadSettings(const std::filesystem::path& path)
    -> PreviewResult<PreviewSettings> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Cannot open settings file: " + path.string());
    }

    try {
        auto j = json::parse(file);
        if (!j.is_object()) {
            return failure(PreviewErrorCode::ConfigurationError,
                           "Settings file must contain a JSON object: " +
                               path.string());
        }
        return PreviewSettings::fromJson(j);
    } catch (const json::exception& e) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Invalid settings file: " + path.string(), e.what());
    }
}

}  // namespace devpreview::config
