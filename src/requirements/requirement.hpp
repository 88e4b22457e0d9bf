/*
 * requirement.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Environment requirement contract checked by the setup engine

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_REQUIREMENT_HPP
#define DEVPREVIEW_REQUIREMENTS_REQUIREMENT_HPP

#include <functional>
#include <optional>
#include <string>

#include "common/preview_result.hpp"

namespace devpreview::requirements {

/**
 * @brief One independent environment check.
 *
 * check() is called once per setup run, possibly concurrently with other
 * requirements, and returns the fulfilled message or the reason it is not
 * met.
 */
class Requirement {
public:
    virtual ~Requirement() = default;

    [[nodiscard]] virtual auto title() const -> std::string = 0;

    /**
     * @brief Extra guidance shown next to the outcome, pass or fail
     */
    [[nodiscard]] virtual auto supplementalMessage() const
        -> std::optional<std::string> {
        return std::nullopt;
    }

    [[nodiscard]] virtual auto check() -> PreviewResult<std::string> = 0;
};

/**
 * @brief Requirement backed by a callable
 */
class FunctionRequirement final : public Requirement {
public:
    using CheckFunction = std::function<PreviewResult<std::string>()>;

    FunctionRequirement(std::string title, CheckFunction check,
                        std::optional<std::string> supplemental = std::nullopt)
        : title_(std::move(title)),
          check_(std::move(check)),
          supplemental_(std::move(supplemental)) {}

    [[nodiscard]] auto title() const -> std::string override { return title_; }

    [[nodiscard]] auto supplementalMessage() const
        -> std::optional<std::string> override {
        return supplemental_;
    }

    [[nodiscard]] auto check() -> PreviewResult<std::string> override {
        return check_();
    }

private:
    std::string title_;
    CheckFunction check_;
    std::optional<std::string> supplemental_;
};

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_REQUIREMENT_HPP
