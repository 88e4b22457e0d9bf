/*
 * common_requirements.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Requirements shared by every platform setup

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_COMMON_REQUIREMENTS_HPP
#define DEVPREVIEW_REQUIREMENTS_COMMON_REQUIREMENTS_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "config/settings.hpp"
#include "process/process_runner.hpp"
#include "requirement.hpp"

namespace devpreview::requirements {

/**
 * @brief The local development server plugin is installed, installing it
 * when it is missing
 */
class ServerPluginRequirement final : public Requirement {
public:
    ServerPluginRequirement(std::shared_ptr<process::ProcessRunner> runner,
                            std::shared_ptr<spdlog::logger> logger,
                            config::ServerSettings settings);

    [[nodiscard]] auto title() const -> std::string override;
    [[nodiscard]] auto check() -> PreviewResult<std::string> override;

private:
    [[nodiscard]] auto isInstalled() -> bool;

    std::shared_ptr<process::ProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
    config::ServerSettings settings_;
};

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_COMMON_REQUIREMENTS_HPP
