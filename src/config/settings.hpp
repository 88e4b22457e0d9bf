/*
 * settings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Preview tool settings loaded from a JSON file

**************************************************/

#ifndef DEVPREVIEW_CONFIG_SETTINGS_HPP
#define DEVPREVIEW_CONFIG_SETTINGS_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/preview_result.hpp"
#include "device/boot_poller.hpp"
#include "logging/logger_factory.hpp"

namespace devpreview::config {

using json = nlohmann::json;

/**
 * @brief iOS simulator settings
 */
struct IosSettings {
    std::string minimumRuntimeVersion{"16.0"};
    std::string deviceFamily{"iPhone"};  ///< Device types offered for creation
    device::BootPollPolicy bootPoll{60, std::chrono::milliseconds(1000)};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> IosSettings;
};

/**
 * @brief Android emulator settings
 */
struct AndroidSettings {
    std::string sdkRoot;  ///< Empty means "resolve from the environment"
    std::string minimumApiLevel{"28"};
    std::vector<std::string> supportedImages{"google_apis", "default",
                                             "google_apis_playstore"};
    std::vector<std::string> supportedAbis{"x86_64", "x86", "arm64-v8a"};
    std::vector<std::string> preferredDeviceProfiles{"pixel"};
    int firstEmulatorPort{5554};
    int lastEmulatorPort{5584};
    device::BootPollPolicy bootPoll{120, std::chrono::milliseconds(1000)};

    /**
     * @brief SDK root from settings, else ANDROID_HOME, else ANDROID_SDK_ROOT
     */
    [[nodiscard]] auto resolveSdkRoot() const -> std::string;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> AndroidSettings;
};

/**
 * @brief Local development server settings
 */
struct ServerSettings {
    std::string cliExecutable{"sfdx"};
    std::string pluginName{"@salesforce/lwc-dev-server"};
    std::string defaultPort{"3333"};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> ServerSettings;
};

struct PreviewSettings {
    logging::LoggingConfig logging;
    IosSettings ios;
    AndroidSettings android;
    ServerSettings server;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> PreviewSettings;
};

/**
 * @brief Load settings from a JSON file. Missing keys keep their defaults.
 * @return Settings or ConfigurationError when the file cannot be read or
 * parsed
 */
[[nodiscard]] auto loadSettings(const std::filesystem::path& path)
    -> PreviewResult<PreviewSettings>;

}  // namespace devpreview::config

#endif  // DEVPREVIEW_CONFIG_SETTINGS_HPP
