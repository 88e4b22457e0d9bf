/*
 * system_process_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Host process runner implementation

*************************************************/

#include "system_process_runner.hpp"

#include "atom/system/command.hpp"
#include "atom/system/software.hpp"

namespace devpreview::process {

SystemProcessRunner::SystemProcessRunner(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

auto SystemProcessRunner::execute(const ProcessConfig& config)
    -> std::expected<ProcessResult, ProcessError> {
    if (!validateExecutable(config.executable)) {
        logger_->debug("Executable not found: {}", config.executable.string());
        return std::unexpected(ProcessError::NotFound);
    }

    auto startTime = std::chrono::steady_clock::now();
    ProcessResult result;

    try {
        std::string cmdLine = buildCommandLine(config);
        if (config.mergeStderr) {
            cmdLine += " 2>&1";
        }
        if (!config.standardInput.empty()) {
            cmdLine = "printf '%s\\n' " + quoteArgument(config.standardInput) +
                      " | " + cmdLine;
        }
        logger_->debug("Executing: {}", cmdLine);

        auto [output, status] = atom::system::executeCommandWithStatus(cmdLine);
        result.stdOut = std::move(output);
        result.exitCode = status;
    } catch (const std::exception& ex) {
        logger_->error("Process execution failed: {}", ex.what());
        return std::unexpected(ProcessError::ExecutionFailed);
    }

    auto endTime = std::chrono::steady_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        endTime - startTime);
    logger_->trace("Exit code {} after {} ms", result.exitCode,
                   result.duration.count());
    return result;
}

auto SystemProcessRunner::spawnDetached(const ProcessConfig& config)
    -> std::expected<int, ProcessError> {
    if (!validateExecutable(config.executable)) {
        return std::unexpected(ProcessError::NotFound);
    }

    try {
        std::string cmdLine = buildCommandLine(config);
        logger_->debug("Spawning: {}", cmdLine);
        auto [pid, handle] = atom::system::startProcess(cmdLine);
        (void)handle;
        if (pid <= 0) {
            logger_->error("Failed to start process: {}", cmdLine);
            return std::unexpected(ProcessError::ExecutionFailed);
        }
        return static_cast<int>(pid);
    } catch (const std::exception& ex) {
        logger_->error("Process spawn failed: {}", ex.what());
        return std::unexpected(ProcessError::ExecutionFailed);
    }
}

auto SystemProcessRunner::validateExecutable(const std::filesystem::path& path)
    -> bool {
    if (path.empty()) {
        return false;
    }
    if (path.is_absolute()) {
        return std::filesystem::exists(path);
    }
    return atom::system::checkSoftwareInstalled(path.string());
}

}  // namespace devpreview::process
