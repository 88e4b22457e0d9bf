/*
 * preview_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Preview operation result types using std::expected

**************************************************/

#ifndef DEVPREVIEW_COMMON_PREVIEW_RESULT_HPP
#define DEVPREVIEW_COMMON_PREVIEW_RESULT_HPP

#include <expected>
#include <string>
#include <type_traits>

#include "preview_error.hpp"

namespace devpreview {

/**
 * @brief Result type for preview operations
 *
 * Either the successful value or the PreviewError that stopped the
 * operation.
 */
template <typename T>
using PreviewResult = std::expected<T, PreviewError>;

using PreviewVoidResult = PreviewResult<void>;

template <typename T>
[[nodiscard]] inline auto success(T&& value)
    -> PreviewResult<std::decay_t<T>> {
    return PreviewResult<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline auto success() -> PreviewVoidResult {
    return PreviewVoidResult();
}

/**
 * @brief Build an unexpected value from a code and message
 */
[[nodiscard]] inline auto failure(PreviewErrorCode code, std::string message)
    -> std::unexpected<PreviewError> {
    return std::unexpected(PreviewError(code, std::move(message)));
}

[[nodiscard]] inline auto failure(PreviewErrorCode code, std::string message,
                                  std::string details)
    -> std::unexpected<PreviewError> {
    return std::unexpected(
        PreviewError(code, std::move(message), std::move(details)));
}

[[nodiscard]] inline auto failure(const PreviewError& error)
    -> std::unexpected<PreviewError> {
    return std::unexpected(error);
}

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_PREVIEW_RESULT_HPP
