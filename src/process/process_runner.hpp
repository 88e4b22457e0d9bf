/*
 * process_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Process execution contract consumed by the preview core

*************************************************/

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <future>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/preview_result.hpp"

namespace devpreview::process {

/**
 * @brief Process execution result
 */
struct ProcessResult {
    int exitCode{-1};
    std::string stdOut;
    std::string stdErr;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] auto success() const noexcept -> bool {
        return exitCode == 0;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return success(); }
};

/**
 * @brief Process execution error types
 */
enum class ProcessError { NotFound, ExecutionFailed, InvalidArgument };

[[nodiscard]] auto processErrorToString(ProcessError error) -> std::string;

/**
 * @brief Process execution configuration
 */
struct ProcessConfig {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    std::string standardInput;  ///< Text piped to the process, if any
    bool mergeStderr{false};
};

/**
 * @brief Executes external commands for the preview core
 *
 * The core never talks to the operating system directly; every simulator,
 * emulator and toolchain interaction goes through an implementation of
 * this interface, which makes the command/output contract testable with
 * scripted fakes.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Execute a process synchronously and capture its output
     * @param config Process configuration
     * @return Result (including non-zero exits) or error if it could not run
     */
    [[nodiscard]] virtual auto execute(const ProcessConfig& config)
        -> std::expected<ProcessResult, ProcessError> = 0;

    /**
     * @brief Execute a process asynchronously
     * @param config Process configuration
     * @return Future containing result
     */
    [[nodiscard]] virtual auto executeAsync(const ProcessConfig& config)
        -> std::future<std::expected<ProcessResult, ProcessError>>;

    /**
     * @brief Start a long-running process without waiting for it
     * @param config Process configuration
     * @return Process id or error
     */
    [[nodiscard]] virtual auto spawnDetached(const ProcessConfig& config)
        -> std::expected<int, ProcessError> = 0;

    /**
     * @brief Build a shell command line string from config
     */
    [[nodiscard]] static auto buildCommandLine(const ProcessConfig& config)
        -> std::string;

    /**
     * @brief Single-quote an argument for the POSIX shell when needed
     */
    [[nodiscard]] static auto quoteArgument(std::string_view arg)
        -> std::string;
};

/**
 * @brief Command line argument builder with fluent interface
 */
class CommandBuilder {
public:
    explicit CommandBuilder(std::string_view executable);

    auto addFlag(std::string_view flag) -> CommandBuilder&;

    auto addOption(std::string_view option, std::string_view value)
        -> CommandBuilder&;

    auto addOptionIf(bool condition, std::string_view option,
                     std::string_view value) -> CommandBuilder&;

    auto addArg(std::string_view arg) -> CommandBuilder&;

    auto addArgs(std::span<const std::string> args) -> CommandBuilder&;

    auto mergeStderr(bool merge = true) -> CommandBuilder&;

    auto withInput(std::string_view input) -> CommandBuilder&;

    [[nodiscard]] auto build() const -> ProcessConfig;

    [[nodiscard]] auto toString() const -> std::string;

private:
    ProcessConfig config_;
};

/**
 * @brief Run a command and treat a non-zero exit as a failure.
 * @param runner Runner to execute with
 * @param config Command to execute
 * @param onFailure Error code reported when the command fails
 * @return Captured result or the failure
 */
[[nodiscard]] auto runChecked(ProcessRunner& runner,
                              const ProcessConfig& config,
                              PreviewErrorCode onFailure)
    -> PreviewResult<ProcessResult>;

}  // namespace devpreview::process
