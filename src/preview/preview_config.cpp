/*
 * preview_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "preview_config.hpp"

#include <algorithm>

#include "common/string_utils.hpp"

namespace devpreview::preview {

namespace {

auto parseAppList(const json& j, const char* key)
    -> PreviewResult<std::vector<AppPreviewConfig>> {
    std::vector<AppPreviewConfig> apps;
    if (!j.contains(key)) {
        return apps;
    }
    const auto& list = j[key];
    if (!list.is_array()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       std::string("\"apps.") + key + "\" must be an array");
    }
    for (const auto& entry : list) {
        auto app = AppPreviewConfig::fromJson(entry);
        if (!app) {
            return std::unexpected(app.error());
        }
        apps.push_back(std::move(*app));
    }
    return apps;
}

}  // namespace

auto platformToString(Platform platform) -> std::string {
    switch (platform) {
        case Platform::Ios:
            return "ios";
        case Platform::Android:
            return "android";
    }
    return "unknown";
}

auto platformFromString(std::string_view value) -> PreviewResult<Platform> {
    auto platform = utils::toLower(utils::trim(value));
    if (platform == "ios") {
        return Platform::Ios;
    }
    if (platform == "android") {
        return Platform::Android;
    }
    return failure(PreviewErrorCode::InvalidArgument,
                   "Unsupported platform: " + std::string(value));
}

auto platformFromRequest(const json& request) -> PreviewResult<Platform> {
    if (!request.is_object()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Preview request must be a JSON object");
    }
    auto it = request.find("platform");
    if (it == request.end()) {
        return failure(PreviewErrorCode::InvalidArgument,
                       "Preview request needs a platform");
    }
    if (!it->is_string()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Preview request \"platform\" must be a string");
    }
    return platformFromString(it->get_ref<const std::string&>());
}

auto AppPreviewConfig::toJson() const -> json {
    json args = json::array();
    for (const auto& arg : launchArguments) {
        args.push_back({{"name", arg.name}, {"value", arg.value}});
    }
    json j = {{"id", id},
              {"name", name},
              {"activity", activity},
              {"launch_arguments", args},
              {"preview_server_enabled", previewServerEnabled}};
    if (appBundlePath) {
        j["app_bundle_path"] = *appBundlePath;
    }
    return j;
}

auto AppPreviewConfig::fromJson(const json& j)
    -> PreviewResult<AppPreviewConfig> {
    if (!j.is_object()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "App preview configuration must be an object");
    }
    try {
        AppPreviewConfig cfg;
        cfg.id = j.value("id", "");
        if (cfg.id.empty()) {
            return failure(PreviewErrorCode::ConfigurationError,
                           "App preview configuration has no id");
        }
        cfg.name = j.value("name", cfg.id);
        cfg.activity = j.value("activity", "");
        cfg.previewServerEnabled = j.value("preview_server_enabled", false);
        if (j.contains("app_bundle_path")) {
            cfg.appBundlePath = j["app_bundle_path"].get<std::string>();
        }
        if (j.contains("launch_arguments")) {
            for (const auto& arg : j["launch_arguments"]) {
                cfg.launchArguments.push_back(
                    {arg.at("name").get<std::string>(),
                     arg.at("value").get<std::string>()});
            }
        }
        return cfg;
    } catch (const json::exception& e) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Invalid app preview configuration", e.what());
    }
}

auto PreviewConfigFile::fromJson(const json& j)
    -> PreviewResult<PreviewConfigFile> {
    if (!j.is_object() || !j.contains("apps") || !j["apps"].is_object()) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Preview configuration needs an \"apps\" object");
    }
    PreviewConfigFile file;
    auto ios = parseAppList(j["apps"], "ios");
    if (!ios) {
        return std::unexpected(ios.error());
    }
    auto android = parseAppList(j["apps"], "android");
    if (!android) {
        return std::unexpected(android.error());
    }
    file.iosApps_ = std::move(*ios);
    file.androidApps_ = std::move(*android);
    return file;
}

auto PreviewConfigFile::apps(Platform platform) const
    -> const std::vector<AppPreviewConfig>& {
    return platform == Platform::Ios ? iosApps_ : androidApps_;
}

auto PreviewConfigFile::appConfig(Platform platform,
                                  std::string_view targetApp) const
    -> std::optional<AppPreviewConfig> {
    const auto& list = apps(platform);
    auto it = std::find_if(list.begin(), list.end(), [targetApp](const auto& a) {
        return a.id == targetApp;
    });
    if (it == list.end()) {
        return std::nullopt;
    }
    return *it;
}

auto PreviewRequest::toJson() const -> json {
    json j = {{"platform", platformToString(platform)},
              {"deviceName", deviceName},
              {"componentName", componentName},
              {"projectDir", projectDir},
              {"targetApp", targetApp},
              {"serverPort", serverPort},
              {"targetingLwrServer", targetingLwrServer}};
    if (appBundlePath) {
        j["appBundlePath"] = *appBundlePath;
    }
    if (appConfig) {
        j["appConfig"] = appConfig->toJson();
    }
    return j;
}

auto PreviewRequest::fromJson(const json& j, std::string_view defaultPort)
    -> PreviewResult<PreviewRequest> {
    auto platform = platformFromRequest(j);
    if (!platform) {
        return std::unexpected(platform.error());
    }
    try {
        PreviewRequest request;
        request.platform = *platform;
        request.deviceName = j.value("deviceName", "");
        request.componentName = j.value("componentName", "");
        request.projectDir = j.value("projectDir", "");
        request.targetApp =
            j.value("targetApp", std::string(kBrowserTarget));
        request.serverPort = j.value("serverPort", std::string(defaultPort));
        request.targetingLwrServer = j.value("targetingLwrServer", false);
        if (j.contains("appBundlePath")) {
            request.appBundlePath = j["appBundlePath"].get<std::string>();
        }

        if (request.deviceName.empty() || request.componentName.empty()) {
            return failure(PreviewErrorCode::InvalidArgument,
                           "Preview request needs deviceName and componentName");
        }

        if (j.contains("previewConfig")) {
            auto file = PreviewConfigFile::fromJson(j["previewConfig"]);
            if (!file) {
                return std::unexpected(file.error());
            }
            request.appConfig =
                file->appConfig(request.platform, request.targetApp);
        }

        if (!isTargetingBrowser(request.targetApp) && !request.appConfig) {
            return failure(PreviewErrorCode::ConfigurationError,
                           "No preview configuration for app " +
                               request.targetApp);
        }
        if (!request.appBundlePath && request.appConfig) {
            request.appBundlePath = request.appConfig->appBundlePath;
        }
        return request;
    } catch (const json::exception& e) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Invalid preview request", e.what());
    }
}

auto isTargetingBrowser(std::string_view targetApp) -> bool {
    return utils::iequals(utils::trim(targetApp), kBrowserTarget);
}

auto prefixRouteIfNeeded(std::string_view componentName) -> std::string {
    if (componentName.size() >= 2 &&
        utils::iequals(componentName.substr(0, 2), "c/")) {
        return std::string(componentName);
    }
    return "c/" + std::string(componentName);
}

auto useServerForPreviewing(std::string_view targetApp,
                            const std::optional<AppPreviewConfig>& config)
    -> bool {
    if (isTargetingBrowser(targetApp)) {
        return true;
    }
    return config.has_value() && config->previewServerEnabled;
}

auto composePreviewUrl(std::string_view address, std::string_view port,
                       std::string_view componentName, bool targetingLwrServer)
    -> std::string {
    auto base = std::string(address) + ":" + std::string(port);
    if (targetingLwrServer) {
        return base;
    }
    return base + "/lwc/preview/" + prefixRouteIfNeeded(componentName);
}

auto buildLaunchArguments(const PreviewRequest& request,
                          const std::optional<std::string>& serverAddress,
                          const std::optional<std::string>& serverPort)
    -> std::vector<LaunchArgument> {
    std::vector<LaunchArgument> args;
    if (request.appConfig) {
        args = request.appConfig->launchArguments;
    }
    args.push_back({std::string(kComponentNameArg), request.componentName});
    args.push_back({std::string(kProjectDirArg), request.projectDir});
    if (serverAddress) {
        args.push_back({std::string(kServerAddressArg), *serverAddress});
    }
    if (serverPort) {
        args.push_back({std::string(kServerPortArg), *serverPort});
    }
    return args;
}

}  // namespace devpreview::preview
