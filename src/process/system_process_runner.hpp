/*
 * system_process_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Host process runner backed by the atom system library

*************************************************/

#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include "process_runner.hpp"

namespace devpreview::process {

/**
 * @brief ProcessRunner that executes commands through the host shell
 */
class SystemProcessRunner final : public ProcessRunner {
public:
    explicit SystemProcessRunner(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto execute(const ProcessConfig& config)
        -> std::expected<ProcessResult, ProcessError> override;

    [[nodiscard]] auto spawnDetached(const ProcessConfig& config)
        -> std::expected<int, ProcessError> override;

    /**
     * @brief Check if executable exists and is runnable
     */
    [[nodiscard]] static auto validateExecutable(
        const std::filesystem::path& path) -> bool;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace devpreview::process
