/*
 * boot_poller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bounded polling loop used while a device boots

**************************************************/

#ifndef DEVPREVIEW_DEVICE_BOOT_POLLER_HPP
#define DEVPREVIEW_DEVICE_BOOT_POLLER_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "common/preview_result.hpp"

namespace devpreview::device {

/**
 * @brief Poll budget: at most maxAttempts probes, interval apart. At least
 * one probe is always made and the interval is never negative.
 */
struct BootPollPolicy {
    int maxAttempts{120};
    std::chrono::milliseconds interval{1000};

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"maxAttempts", maxAttempts},
                {"intervalMs", interval.count()}};
    }

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> BootPollPolicy {
        BootPollPolicy policy;
        policy.maxAttempts = j.value("maxAttempts", policy.maxAttempts);
        policy.interval = std::chrono::milliseconds(
            j.value("intervalMs", static_cast<int64_t>(policy.interval.count())));
        return policy.clamped();
    }

    [[nodiscard]] auto clamped() const -> BootPollPolicy {
        return {std::max(maxAttempts, 1),
                std::max(interval, std::chrono::milliseconds::zero())};
    }
};

class BootPoller {
public:
    /**
     * @brief Probe result: true when ready, false to keep waiting. Errors are
     * treated as "not ready yet" and remembered for the timeout report.
     */
    using Probe = std::function<PreviewResult<bool>()>;

    BootPoller(std::shared_ptr<Clock> clock,
               std::shared_ptr<spdlog::logger> logger, BootPollPolicy policy);

    /**
     * @brief Probe until ready or the attempt budget runs out.
     * @param probe Status check
     * @param what Description used in logs and in the timeout error
     * @return Success, or BootTimeout once maxAttempts probes failed
     */
    [[nodiscard]] auto waitUntil(const Probe& probe, const std::string& what)
        -> PreviewVoidResult;

    [[nodiscard]] auto policy() const noexcept -> const BootPollPolicy& {
        return policy_;
    }

private:
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
    BootPollPolicy policy_;
};

}  // namespace devpreview::device

#endif  // DEVPREVIEW_DEVICE_BOOT_POLLER_HPP
