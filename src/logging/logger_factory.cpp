/*
 * logger_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger_factory.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/string_utils.hpp"

namespace devpreview::logging {

auto logLevelFromString(const std::string& level)
    -> spdlog::level::level_enum {
    auto str = utils::toLower(utils::trim(level));
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off" || str == "none") return spdlog::level::off;
    return spdlog::level::info;
}

auto createLogger(const std::string& name, const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    auto level = logLevelFromString(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(level);
    sinks.push_back(console);

    if (!config.filePath.empty()) {
        std::filesystem::path path(config.filePath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            config.filePath, false);
        file->set_level(spdlog::level::trace);
        sinks.push_back(file);
    }

    auto logger =
        std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config.filePath.empty() ? level : spdlog::level::trace);
    logger->set_pattern(config.pattern);
    return logger;
}

auto tryCreateLogger(const std::string& name, const LoggingConfig& config)
    -> PreviewResult<std::shared_ptr<spdlog::logger>> {
    try {
        return createLogger(name, config);
    } catch (const spdlog::spdlog_ex& e) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Cannot open log file: " + config.filePath, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return failure(PreviewErrorCode::ConfigurationError,
                       "Cannot create log directory for: " + config.filePath,
                       e.what());
    }
}

}  // namespace devpreview::logging
