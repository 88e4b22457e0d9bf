/*
 * setup_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Builds the per-platform setup engines

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_SETUP_FACTORY_HPP
#define DEVPREVIEW_REQUIREMENTS_SETUP_FACTORY_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "config/settings.hpp"
#include "process/process_runner.hpp"
#include "setup_engine.hpp"

namespace devpreview::requirements {

/**
 * @brief Collaborators shared by every requirement of a setup
 */
struct SetupContext {
    std::shared_ptr<process::ProcessRunner> runner;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<spdlog::logger> logger;
    config::PreviewSettings settings;
};

/**
 * @brief Server plugin, macOS, Xcode and simulator runtime checks
 */
[[nodiscard]] auto makeIosSetup(const SetupContext& context)
    -> std::unique_ptr<SetupEngine>;

/**
 * @brief Server plugin, SDK root, command line tools, platform tools,
 * platform API and emulator image checks
 */
[[nodiscard]] auto makeAndroidSetup(const SetupContext& context)
    -> std::unique_ptr<SetupEngine>;

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_SETUP_FACTORY_HPP
