/*
 * logger_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Creates the named spdlog loggers handed to preview components

**************************************************/

#ifndef DEVPREVIEW_LOGGING_LOGGER_FACTORY_HPP
#define DEVPREVIEW_LOGGING_LOGGER_FACTORY_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/preview_result.hpp"

namespace devpreview::logging {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"warn"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    std::string filePath;  ///< Optional log file, empty disables it

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"level", level}, {"pattern", pattern}, {"filePath", filePath}};
    }

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.filePath = j.value("filePath", cfg.filePath);
        return cfg;
    }
};

/**
 * @brief Convert a level name to spdlog level ("warning", "err" and "fatal"
 * are accepted as aliases). Unknown names map to info.
 */
[[nodiscard]] auto logLevelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Create a named logger writing to stderr and optionally to a file.
 *
 * The logger is not registered globally; callers pass it to the components
 * that need it.
 */
[[nodiscard]] auto createLogger(const std::string& name,
                                const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief createLogger() that reports an unusable log file as a
 * ConfigurationError instead of throwing.
 */
[[nodiscard]] auto tryCreateLogger(const std::string& name,
                                   const LoggingConfig& config)
    -> PreviewResult<std::shared_ptr<spdlog::logger>>;

}  // namespace devpreview::logging

#endif  // DEVPREVIEW_LOGGING_LOGGER_FACTORY_HPP
