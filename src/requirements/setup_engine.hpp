/*
 * setup_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Runs environment requirements concurrently and aggregates a
validation report

**************************************************/

#ifndef DEVPREVIEW_REQUIREMENTS_SETUP_ENGINE_HPP
#define DEVPREVIEW_REQUIREMENTS_SETUP_ENGINE_HPP

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "requirement.hpp"

namespace devpreview::requirements {

struct RequirementOutcome {
    std::string title;
    bool passed{false};
    std::string message;
    std::optional<std::string> supplementalMessage;
    double durationSeconds{0.0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Immutable result of one setup run, outcomes in requirement order
 */
class ValidationReport {
public:
    explicit ValidationReport(std::vector<RequirementOutcome> outcomes);

    [[nodiscard]] auto allRequirementsMet() const noexcept -> bool {
        return allMet_;
    }
    [[nodiscard]] auto outcomes() const
        -> const std::vector<RequirementOutcome>& {
        return outcomes_;
    }
    [[nodiscard]] auto totalDurationSeconds() const noexcept -> double {
        return totalDuration_;
    }
    [[nodiscard]] auto passedCount() const -> std::size_t;

    /**
     * @brief "N of M requirements passed"
     */
    [[nodiscard]] auto summary() const -> std::string;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    std::vector<RequirementOutcome> outcomes_;
    bool allMet_{true};
    double totalDuration_{0.0};
};

/**
 * @brief Owns the requirement list of one setup (iOS or Android).
 *
 * executeSetup() starts every check at once and waits for all of them; a
 * failing or throwing check is recorded and never hides the others.
 */
class SetupEngine {
public:
    SetupEngine(std::shared_ptr<Clock> clock,
                std::shared_ptr<spdlog::logger> logger);

    void addRequirement(std::shared_ptr<Requirement> requirement);
    void addRequirements(
        const std::vector<std::shared_ptr<Requirement>>& requirements);

    [[nodiscard]] auto requirements() const
        -> const std::vector<std::shared_ptr<Requirement>>& {
        return requirements_;
    }

    [[nodiscard]] auto executeSetup() const -> ValidationReport;

    /**
     * @brief executeSetup() on a background thread. The engine must outlive
     * the returned future.
     */
    [[nodiscard]] auto executeSetupAsync() const
        -> std::future<ValidationReport>;

private:
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<std::shared_ptr<Requirement>> requirements_;
};

}  // namespace devpreview::requirements

#endif  // DEVPREVIEW_REQUIREMENTS_SETUP_ENGINE_HPP
