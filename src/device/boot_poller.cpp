/*
 * boot_poller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "boot_poller.hpp"

namespace devpreview::device {

BootPoller::BootPoller(std::shared_ptr<Clock> clock,
                       std::shared_ptr<spdlog::logger> logger,
                       BootPollPolicy policy)
    : clock_(std::move(clock)),
      logger_(std::move(logger)),
      policy_(policy.clamped()) {}

auto BootPoller::waitUntil(const Probe& probe, const std::string& what)
    -> PreviewVoidResult {
    auto start = clock_->now();
    std::string lastError;

    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        auto status = probe();
        if (status && *status) {
            logger_->info("{} is ready after {} attempt(s)", what, attempt);
            return success();
        }
        if (!status) {
            lastError = status.error().toString();
            logger_->debug("{} not ready (attempt {}): {}", what, attempt,
                           lastError);
        } else {
            logger_->debug("{} not ready (attempt {})", what, attempt);
        }

        if (attempt < policy_.maxAttempts) {
            clock_->sleepFor(policy_.interval);
        }
    }

    auto elapsed = secondsBetween(start, clock_->now());
    logger_->warn("{} timeout after {} attempts ({:.3f} sec)", what,
                  policy_.maxAttempts, elapsed);
    if (lastError.empty()) {
        return failure(PreviewErrorCode::BootTimeout,
                       "Timed out waiting for " + what);
    }
    return failure(PreviewErrorCode::BootTimeout,
                   "Timed out waiting for " + what, lastError);
}

}  // namespace devpreview::device
