/*
 * setup_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Setup engine implementation

**************************************************/

#include "setup_engine.hpp"

#include <algorithm>
#include <exception>

#include "common/settle.hpp"

namespace devpreview::requirements {

namespace {

using CheckResult = PreviewResult<std::string>;

/**
 * Records the end time when the check returns or unwinds.
 */
class Stopwatch {
public:
    Stopwatch(const Clock& clock, Clock::TimePoint& end)
        : clock_(clock), end_(end) {}
    ~Stopwatch() { end_ = clock_.now(); }

    Stopwatch(const Stopwatch&) = delete;
    Stopwatch& operator=(const Stopwatch&) = delete;

private:
    const Clock& clock_;
    Clock::TimePoint& end_;
};

auto describeException(const std::exception_ptr& error) -> std::string {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace

auto RequirementOutcome::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"title", title},
                        {"hasPassed", passed},
                        {"message", message},
                        {"duration", durationSeconds}};
    if (supplementalMessage) {
        j["supplementalMessage"] = *supplementalMessage;
    }
    return j;
}

ValidationReport::ValidationReport(std::vector<RequirementOutcome> outcomes)
    : outcomes_(std::move(outcomes)) {
    for (const auto& outcome : outcomes_) {
        allMet_ = allMet_ && outcome.passed;
        totalDuration_ += outcome.durationSeconds;
    }
}

auto ValidationReport::passedCount() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(outcomes_.begin(), outcomes_.end(),
                      [](const auto& outcome) { return outcome.passed; }));
}

auto ValidationReport::summary() const -> std::string {
    return std::to_string(passedCount()) + " of " +
           std::to_string(outcomes_.size()) + " requirements passed";
}

auto ValidationReport::toJson() const -> nlohmann::json {
    nlohmann::json tests = nlohmann::json::array();
    for (const auto& outcome : outcomes_) {
        tests.push_back(outcome.toJson());
    }
    return {{"hasMetAllRequirements", allMet_},
            {"summary", summary()},
            {"totalDuration", totalDuration_},
            {"tests", tests}};
}

SetupEngine::SetupEngine(std::shared_ptr<Clock> clock,
                         std::shared_ptr<spdlog::logger> logger)
    : clock_(std::move(clock)), logger_(std::move(logger)) {}

void SetupEngine::addRequirement(std::shared_ptr<Requirement> requirement) {
    if (requirement) {
        requirements_.push_back(std::move(requirement));
    }
}

void SetupEngine::addRequirements(
    const std::vector<std::shared_ptr<Requirement>>& requirements) {
    for (const auto& requirement : requirements) {
        addRequirement(requirement);
    }
}

auto SetupEngine::executeSetup() const -> ValidationReport {
    const auto count = requirements_.size();
    std::vector<Clock::TimePoint> starts(count);
    std::vector<Clock::TimePoint> ends(count);

    std::vector<std::function<CheckResult()>> tasks;
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        tasks.emplace_back([this, i, &starts, &ends]() -> CheckResult {
            starts[i] = clock_->now();
            Stopwatch stopwatch(*clock_, ends[i]);
            return requirements_[i]->check();
        });
    }

    logger_->debug("Running {} requirement check(s)", count);
    auto settled = settleAll(std::move(tasks));

    std::vector<RequirementOutcome> outcomes;
    outcomes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& requirement = requirements_[i];
        RequirementOutcome outcome;
        outcome.title = requirement->title();
        outcome.supplementalMessage = requirement->supplementalMessage();
        outcome.durationSeconds = secondsBetween(starts[i], ends[i]);

        const auto& result = settled[i];
        if (!result) {
            outcome.message = describeException(result.error());
        } else if (!*result) {
            outcome.message = (*result).error().message;
        } else {
            outcome.passed = true;
            outcome.message = **result;
        }

        if (outcome.passed) {
            logger_->info("Passed: {} ({:.3f} sec)", outcome.title,
                          outcome.durationSeconds);
        } else {
            logger_->warn("Failed: {} ({:.3f} sec): {}", outcome.title,
                          outcome.durationSeconds, outcome.message);
        }
        outcomes.push_back(std::move(outcome));
    }

    ValidationReport report(std::move(outcomes));
    logger_->info("Setup ({:.3f} sec): {}", report.totalDurationSeconds(),
                  report.summary());
    return report;
}

auto SetupEngine::executeSetupAsync() const -> std::future<ValidationReport> {
    return std::async(std::launch::async, [this]() { return executeSetup(); });
}

}  // namespace devpreview::requirements
