/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: devpreview driver: `devpreview setup|launch <request.json>
[settings.json]`

**************************************************/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "common/preview_exceptions.hpp"
#include "config/settings.hpp"
#include "device/preview_launcher.hpp"
#include "logging/logger_factory.hpp"
#include "preview/preview_config.hpp"
#include "process/system_process_runner.hpp"
#include "requirements/setup_factory.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

template <typename T>
auto valueOrThrow(devpreview::PreviewResult<T> result) -> T {
    if (!result) {
        devpreview::throwPreviewError(result.error());
    }
    return std::move(*result);
}

void printUsage() {
    std::cerr << "Usage: devpreview <setup|launch> <request.json> "
                 "[settings.json]\n";
}

auto readJsonFile(const fs::path& path) -> json {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw devpreview::PreviewException(
            "Cannot open request file: " + path.string(),
            devpreview::PreviewErrorCode::ConfigurationError);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw devpreview::PreviewException(
            devpreview::PreviewError(
                devpreview::PreviewErrorCode::ConfigurationError,
                "Invalid request file: " + path.string(), e.what()));
    }
}

auto runSetup(const json& request,
              const devpreview::requirements::SetupContext& context) -> int {
    auto platform =
        valueOrThrow(devpreview::preview::platformFromRequest(request));

    auto engine = platform == devpreview::preview::Platform::Ios
                      ? devpreview::requirements::makeIosSetup(context)
                      : devpreview::requirements::makeAndroidSetup(context);
    auto report = engine->executeSetup();
    std::cout << report.toJson().dump(2) << std::endl;
    return report.allRequirementsMet() ? kExitSuccess : kExitFailure;
}

auto runLaunch(const json& requestJson,
               const devpreview::requirements::SetupContext& context) -> int {
    using namespace devpreview;

    auto request = valueOrThrow(preview::PreviewRequest::fromJson(
        requestJson, context.settings.server.defaultPort));

    std::unique_ptr<device::PreviewLauncher> launcher;
    if (request.platform == preview::Platform::Ios) {
        launcher = std::make_unique<device::IosPreviewLauncher>(
            std::make_shared<device::ios::SimulatorManager>(
                context.runner, context.clock, context.logger,
                context.settings.ios),
            context.logger);
    } else {
        launcher = std::make_unique<device::AndroidPreviewLauncher>(
            std::make_shared<device::android::EmulatorManager>(
                context.runner, context.clock, context.logger,
                context.settings.android),
            context.logger);
    }

    auto launched = launcher->launchPreview(request);
    if (!launched) {
        throwPreviewError(launched.error());
    }
    std::cout << json{{"status", "launched"}, {"request", request.toJson()}}
                     .dump(2)
              << std::endl;
    return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage();
        return kExitUsage;
    }
    const std::string verb = argv[1];
    if (verb != "setup" && verb != "launch") {
        printUsage();
        return kExitUsage;
    }

    devpreview::config::PreviewSettings settings;
    if (argc > 3) {
        auto loaded = devpreview::config::loadSettings(argv[3]);
        if (!loaded) {
            std::cerr << loaded.error().toString() << std::endl;
            return kExitUsage;
        }
        settings = std::move(*loaded);
    }

    auto created =
        devpreview::logging::tryCreateLogger("devpreview", settings.logging);
    if (!created) {
        std::cerr << created.error().toString() << std::endl;
        return kExitUsage;
    }
    auto logger = *created;
    devpreview::requirements::SetupContext context{
        std::make_shared<devpreview::process::SystemProcessRunner>(logger),
        std::make_shared<devpreview::SteadyClock>(), logger, settings};

    try {
        auto request = readJsonFile(argv[2]);
        return verb == "setup" ? runSetup(request, context)
                               : runLaunch(request, context);
    } catch (const devpreview::PreviewException& e) {
        logger->error("{}", e.what());
        std::cout << json{{"status", "error"}, {"error", e.error().toJson()}}
                         .dump(2)
                  << std::endl;
        auto code = e.code();
        return code == devpreview::PreviewErrorCode::ConfigurationError ||
                       code == devpreview::PreviewErrorCode::InvalidArgument
                   ? kExitUsage
                   : kExitFailure;
    } catch (const json::exception& e) {
        devpreview::PreviewError error(
            devpreview::PreviewErrorCode::ConfigurationError,
            "Invalid request document", e.what());
        logger->error("{}", error.toString());
        std::cout << json{{"status", "error"}, {"error", error.toJson()}}
                         .dump(2)
                  << std::endl;
        return kExitUsage;
    }
}
