/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Injectable monotonic clock used for timing and poll delays

**************************************************/

#ifndef DEVPREVIEW_COMMON_CLOCK_HPP
#define DEVPREVIEW_COMMON_CLOCK_HPP

#include <chrono>
#include <thread>

namespace devpreview {

/**
 * @brief Monotonic time source with a sleep primitive
 *
 * Implementations must be safe to call from several threads at once; the
 * setup engine times concurrent checks against the same instance.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> TimePoint = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] auto now() const -> TimePoint override {
        return std::chrono::steady_clock::now();
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

/**
 * @brief Elapsed seconds between two time points, millisecond precision
 */
[[nodiscard]] inline auto secondsBetween(Clock::TimePoint start,
                                         Clock::TimePoint end) -> double {
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    return static_cast<double>(ms.count()) / 1000.0;
}

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_CLOCK_HPP
