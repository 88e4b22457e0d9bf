/*
 * process_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Process execution utilities implementation

*************************************************/

#include "process_runner.hpp"

#include <sstream>

namespace devpreview::process {

namespace {

auto needsQuoting(std::string_view arg) -> bool {
    if (arg.empty()) {
        return true;
    }
    for (char c : arg) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') ||
                    std::string_view("-_./:=@%+,").find(c) !=
                        std::string_view::npos;
        if (!safe) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto ProcessRunner::quoteArgument(std::string_view arg) -> std::string {
    if (!needsQuoting(arg)) {
        return std::string(arg);
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

auto processErrorToString(ProcessError error) -> std::string {
    switch (error) {
        case ProcessError::NotFound:
            return "executable not found";
        case ProcessError::ExecutionFailed:
            return "execution failed";
        case ProcessError::InvalidArgument:
            return "invalid argument";
    }
    return "unknown process error";
}

// ============================================================================
// ProcessRunner
// ============================================================================

auto ProcessRunner::executeAsync(const ProcessConfig& config)
    -> std::future<std::expected<ProcessResult, ProcessError>> {
    return std::async(std::launch::async,
                      [this, config]() { return execute(config); });
}

auto ProcessRunner::buildCommandLine(const ProcessConfig& config)
    -> std::string {
    std::ostringstream cmd;
    cmd << quoteArgument(config.executable.string());
    for (const auto& arg : config.arguments) {
        cmd << " " << quoteArgument(arg);
    }
    return cmd.str();
}

auto runChecked(ProcessRunner& runner, const ProcessConfig& config,
                PreviewErrorCode onFailure) -> PreviewResult<ProcessResult> {
    auto commandLine = ProcessRunner::buildCommandLine(config);
    auto result = runner.execute(config);
    if (!result) {
        return failure(onFailure, "Command could not be run: " + commandLine,
                       processErrorToString(result.error()));
    }
    if (!result->success()) {
        auto details = result->stdErr.empty() ? result->stdOut : result->stdErr;
        return failure(onFailure,
                       "Command failed with exit code " +
                           std::to_string(result->exitCode) + ": " +
                           commandLine,
                       details);
    }
    return std::move(*result);
}

// ============================================================================
// CommandBuilder Implementation
// ============================================================================

CommandBuilder::CommandBuilder(std::string_view executable) {
    config_.executable = executable;
}

auto CommandBuilder::addFlag(std::string_view flag) -> CommandBuilder& {
    config_.arguments.emplace_back(flag);
    return *this;
}

auto CommandBuilder::addOption(std::string_view option, std::string_view value)
    -> CommandBuilder& {
    config_.arguments.emplace_back(option);
    config_.arguments.emplace_back(value);
    return *this;
}

auto CommandBuilder::addOptionIf(bool condition, std::string_view option,
                                 std::string_view value) -> CommandBuilder& {
    if (condition) {
        config_.arguments.emplace_back(option);
        config_.arguments.emplace_back(value);
    }
    return *this;
}

auto CommandBuilder::addArg(std::string_view arg) -> CommandBuilder& {
    config_.arguments.emplace_back(arg);
    return *this;
}

auto CommandBuilder::addArgs(std::span<const std::string> args)
    -> CommandBuilder& {
    for (const auto& arg : args) {
        config_.arguments.push_back(arg);
    }
    return *this;
}

auto CommandBuilder::mergeStderr(bool merge) -> CommandBuilder& {
    config_.mergeStderr = merge;
    return *this;
}

auto CommandBuilder::withInput(std::string_view input) -> CommandBuilder& {
    config_.standardInput = input;
    return *this;
}

auto CommandBuilder::build() const -> ProcessConfig { return config_; }

auto CommandBuilder::toString() const -> std::string {
    return ProcessRunner::buildCommandLine(config_);
}

}  // namespace devpreview::process
