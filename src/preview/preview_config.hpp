/*
 * preview_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Preview request, per-app preview configuration and the helpers
deciding how a component is previewed

**************************************************/

#ifndef DEVPREVIEW_PREVIEW_PREVIEW_CONFIG_HPP
#define DEVPREVIEW_PREVIEW_PREVIEW_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/preview_result.hpp"

namespace devpreview::preview {

using json = nlohmann::json;

inline constexpr std::string_view kBrowserTarget = "browser";
inline constexpr std::string_view kComponentNameArg = "ComponentName";
inline constexpr std::string_view kProjectDirArg = "ProjectDir";
inline constexpr std::string_view kServerAddressArg = "ServerAddress";
inline constexpr std::string_view kServerPortArg = "ServerPort";

enum class Platform { Ios, Android };

[[nodiscard]] auto platformToString(Platform platform) -> std::string;
[[nodiscard]] auto platformFromString(std::string_view value)
    -> PreviewResult<Platform>;

/**
 * @brief Reads "platform" from a request document. A document that is not an
 * object, or a non-string platform, is a ConfigurationError; a missing or
 * unknown platform is an InvalidArgument.
 */
[[nodiscard]] auto platformFromRequest(const json& request)
    -> PreviewResult<Platform>;

struct LaunchArgument {
    std::string name;
    std::string value;

    auto operator==(const LaunchArgument&) const -> bool = default;
};

/**
 * @brief Preview configuration of one native app
 */
struct AppPreviewConfig {
    std::string id;  ///< Bundle id (iOS) or package name (Android)
    std::string name;
    std::optional<std::string> appBundlePath;
    std::string activity;  ///< Android launch activity
    std::vector<LaunchArgument> launchArguments;
    bool previewServerEnabled{false};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j)
        -> PreviewResult<AppPreviewConfig>;
};

/**
 * @brief Contents of a project's preview configuration file:
 * `{"apps": {"ios": [...], "android": [...]}}`
 */
class PreviewConfigFile {
public:
    [[nodiscard]] static auto fromJson(const json& j)
        -> PreviewResult<PreviewConfigFile>;

    [[nodiscard]] auto appConfig(Platform platform,
                                 std::string_view targetApp) const
        -> std::optional<AppPreviewConfig>;

    [[nodiscard]] auto apps(Platform platform) const
        -> const std::vector<AppPreviewConfig>&;

private:
    std::vector<AppPreviewConfig> iosApps_;
    std::vector<AppPreviewConfig> androidApps_;
};

/**
 * @brief Everything needed to launch one preview
 */
struct PreviewRequest {
    Platform platform{Platform::Ios};
    std::string deviceName;
    std::string componentName;
    std::string projectDir;
    std::string targetApp{kBrowserTarget};
    std::optional<std::string> appBundlePath;
    std::optional<AppPreviewConfig> appConfig;
    std::string serverPort;
    bool targetingLwrServer{false};

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Parse a request. When "previewConfig" holds a preview
     * configuration file the app config for targetApp is taken from it.
     */
    [[nodiscard]] static auto fromJson(const json& j,
                                       std::string_view defaultPort)
        -> PreviewResult<PreviewRequest>;
};

[[nodiscard]] auto isTargetingBrowser(std::string_view targetApp) -> bool;

/**
 * @brief "c/" prefix the component route unless it already has one
 */
[[nodiscard]] auto prefixRouteIfNeeded(std::string_view componentName)
    -> std::string;

/**
 * @brief Browsers always talk to the local server; native apps only when
 * their configuration enables it.
 */
[[nodiscard]] auto useServerForPreviewing(
    std::string_view targetApp, const std::optional<AppPreviewConfig>& config)
    -> bool;

/**
 * @brief `<address>:<port>/lwc/preview/<route>`, or `<address>:<port>` for
 * an LWR server
 */
[[nodiscard]] auto composePreviewUrl(std::string_view address,
                                     std::string_view port,
                                     std::string_view componentName,
                                     bool targetingLwrServer) -> std::string;

/**
 * @brief Launch arguments for a native app: the configured ones followed by
 * ComponentName, ProjectDir and, when set, ServerAddress and ServerPort.
 */
[[nodiscard]] auto buildLaunchArguments(
    const PreviewRequest& request,
    const std::optional<std::string>& serverAddress,
    const std::optional<std::string>& serverPort)
    -> std::vector<LaunchArgument>;

}  // namespace devpreview::preview

#endif  // DEVPREVIEW_PREVIEW_PREVIEW_CONFIG_HPP
