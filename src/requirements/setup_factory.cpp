/*
 * setup_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "setup_factory.hpp"

#include "android_requirements.hpp"
#include "common_requirements.hpp"
#include "ios_requirements.hpp"

namespace devpreview::requirements {

namespace {

auto makeBaseSetup(const SetupContext& context)
    -> std::unique_ptr<SetupEngine> {
    auto engine = std::make_unique<SetupEngine>(context.clock, context.logger);
    engine->addRequirement(std::make_shared<ServerPluginRequirement>(
        context.runner, context.logger, context.settings.server));
    return engine;
}

}  // namespace

auto makeIosSetup(const SetupContext& context)
    -> std::unique_ptr<SetupEngine> {
    auto engine = makeBaseSetup(context);
    auto simulators = std::make_shared<device::ios::SimulatorManager>(
        context.runner, context.clock, context.logger, context.settings.ios);

    engine->addRequirements({
        std::make_shared<SupportedOsRequirement>(context.runner,
                                                 context.logger),
        std::make_shared<XcodeInstalledRequirement>(context.runner,
                                                    context.logger),
        std::make_shared<SimulatorRuntimeRequirement>(
            simulators, context.logger,
            context.settings.ios.minimumRuntimeVersion),
    });
    return engine;
}

auto makeAndroidSetup(const SetupContext& context)
    -> std::unique_ptr<SetupEngine> {
    using device::android::AndroidTool;

    auto engine = makeBaseSetup(context);
    auto emulators = std::make_shared<device::android::EmulatorManager>(
        context.runner, context.clock, context.logger,
        context.settings.android);

    engine->addRequirements({
        std::make_shared<SdkRootRequirement>(emulators, context.logger),
        std::make_shared<ToolVersionRequirement>(
            context.runner, emulators, context.logger, AndroidTool::SdkManager,
            "Android SDK Command-Line Tools"),
        std::make_shared<ToolVersionRequirement>(
            context.runner, emulators, context.logger, AndroidTool::Adb,
            "Android SDK Platform-Tools"),
        std::make_shared<PlatformApiRequirement>(emulators, context.logger,
                                                 context.settings.android),
        std::make_shared<EmulatorImageRequirement>(emulators, context.logger),
    });
    return engine;
}

}  // namespace devpreview::requirements
