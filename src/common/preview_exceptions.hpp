/*
 * preview_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exception hierarchy for preview operations

**************************************************/

#ifndef DEVPREVIEW_COMMON_PREVIEW_EXCEPTIONS_HPP
#define DEVPREVIEW_COMMON_PREVIEW_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "preview_error.hpp"

namespace devpreview {

/**
 * @brief Base exception class for all preview exceptions
 */
class PreviewException : public std::runtime_error {
public:
    explicit PreviewException(const std::string& message,
                              PreviewErrorCode code = PreviewErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    explicit PreviewException(const PreviewError& error)
        : std::runtime_error(error.message), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const PreviewError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> PreviewErrorCode {
        return error_.code;
    }

protected:
    PreviewError error_;
};

class ParseException : public PreviewException {
public:
    explicit ParseException(const std::string& message)
        : PreviewException(message, PreviewErrorCode::ParseError) {}
};

/**
 * @brief Thrown when two distinct codename versions are compared
 */
class UnsupportedComparisonError : public PreviewException {
public:
    UnsupportedComparisonError(const std::string& lhs, const std::string& rhs)
        : PreviewException("Comparing 2 codename versions is not supported: '" +
                               lhs + "' vs '" + rhs + "'",
                           PreviewErrorCode::UnsupportedComparison) {}
};

class BootTimeoutError : public PreviewException {
public:
    explicit BootTimeoutError(const std::string& message)
        : PreviewException(message, PreviewErrorCode::BootTimeout) {}
};

class DeviceCreationError : public PreviewException {
public:
    explicit DeviceCreationError(const std::string& message)
        : PreviewException(message, PreviewErrorCode::DeviceCreation) {}
};

class ToolchainMissingError : public PreviewException {
public:
    explicit ToolchainMissingError(const std::string& message)
        : PreviewException(message, PreviewErrorCode::ToolchainMissing) {}
};

class UnsupportedEnvironmentError : public PreviewException {
public:
    explicit UnsupportedEnvironmentError(const std::string& message)
        : PreviewException(message, PreviewErrorCode::UnsupportedEnvironment) {}
};

class LaunchError : public PreviewException {
public:
    explicit LaunchError(const std::string& message)
        : PreviewException(message, PreviewErrorCode::Launch) {}
};

/**
 * @brief Throw the exception type matching the error code
 */
[[noreturn]] inline void throwPreviewError(const PreviewError& error) {
    switch (error.code) {
        case PreviewErrorCode::ParseError:
            throw ParseException(error.toString());
        case PreviewErrorCode::BootTimeout:
            throw BootTimeoutError(error.toString());
        case PreviewErrorCode::DeviceCreation:
            throw DeviceCreationError(error.toString());
        case PreviewErrorCode::ToolchainMissing:
            throw ToolchainMissingError(error.toString());
        case PreviewErrorCode::UnsupportedEnvironment:
            throw UnsupportedEnvironmentError(error.toString());
        case PreviewErrorCode::Launch:
            throw LaunchError(error.toString());
        default:
            throw PreviewException(error);
    }
}

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_PREVIEW_EXCEPTIONS_HPP
