/*
 * preview_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Error codes and structures for device preview operations

**************************************************/

#ifndef DEVPREVIEW_COMMON_PREVIEW_ERROR_HPP
#define DEVPREVIEW_COMMON_PREVIEW_ERROR_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace devpreview {

/**
 * @brief Error codes for every failure the preview core can report
 */
enum class PreviewErrorCode {
    Unknown = 0,

    // Parsing errors (100-199)
    ParseError = 100,
    FormatError = 101,
    UnsupportedComparison = 102,

    // Device lifecycle errors (200-299)
    BootTimeout = 200,
    DeviceCreation = 201,
    DeviceNotFound = 202,
    Launch = 203,
    ResourceExhausted = 204,

    // Environment errors (300-399)
    ToolchainMissing = 300,
    UnsupportedEnvironment = 301,
    CommandFailed = 302,

    // Internal errors (900-999)
    ConfigurationError = 900,
    InvalidArgument = 901
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto previewErrorCodeToString(PreviewErrorCode code)
    -> std::string {
    switch (code) {
        case PreviewErrorCode::Unknown:
            return "Unknown";
        case PreviewErrorCode::ParseError:
            return "ParseError";
        case PreviewErrorCode::FormatError:
            return "FormatError";
        case PreviewErrorCode::UnsupportedComparison:
            return "UnsupportedComparison";
        case PreviewErrorCode::BootTimeout:
            return "BootTimeout";
        case PreviewErrorCode::DeviceCreation:
            return "DeviceCreation";
        case PreviewErrorCode::DeviceNotFound:
            return "DeviceNotFound";
        case PreviewErrorCode::Launch:
            return "Launch";
        case PreviewErrorCode::ResourceExhausted:
            return "ResourceExhausted";
        case PreviewErrorCode::ToolchainMissing:
            return "ToolchainMissing";
        case PreviewErrorCode::UnsupportedEnvironment:
            return "UnsupportedEnvironment";
        case PreviewErrorCode::CommandFailed:
            return "CommandFailed";
        case PreviewErrorCode::ConfigurationError:
            return "ConfigurationError";
        case PreviewErrorCode::InvalidArgument:
            return "InvalidArgument";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Preview error structure with detailed information
 */
struct PreviewError {
    PreviewErrorCode code{PreviewErrorCode::Unknown};
    std::string message;
    std::optional<std::string> details;

    PreviewError() = default;

    explicit PreviewError(PreviewErrorCode errorCode,
                          std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    PreviewError(PreviewErrorCode errorCode, std::string errorMessage,
                 std::string errorDetails)
        : code(errorCode),
          message(std::move(errorMessage)),
          details(std::move(errorDetails)) {}

    /**
     * @brief Get formatted error string
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + previewErrorCodeToString(code) + "] " + message;
        if (details && !details->empty()) {
            result += " - " + *details;
        }
        return result;
    }

    /**
     * @brief Convert to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["code"] = static_cast<int>(code);
        j["codeName"] = previewErrorCodeToString(code);
        j["message"] = message;
        if (details) {
            j["details"] = *details;
        }
        return j;
    }
};

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_PREVIEW_ERROR_HPP
