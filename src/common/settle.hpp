/*
 * settle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Run independent tasks concurrently and wait for all of them

**************************************************/

#ifndef DEVPREVIEW_COMMON_SETTLE_HPP
#define DEVPREVIEW_COMMON_SETTLE_HPP

#include <exception>
#include <expected>
#include <functional>
#include <future>
#include <vector>

namespace devpreview {

/**
 * @brief Outcome of one settled task: its value or the exception it threw
 */
template <typename T>
using Settled = std::expected<T, std::exception_ptr>;

/**
 * @brief Start every task at once and collect one outcome per task.
 *
 * A task that throws does not cancel or hide the others; its exception is
 * captured in its own slot. Results keep the order of @p tasks.
 */
template <typename T>
[[nodiscard]] auto settleAll(std::vector<std::function<T()>> tasks)
    -> std::vector<Settled<T>> {
    std::vector<std::future<T>> futures;
    futures.reserve(tasks.size());
    for (auto& task : tasks) {
        futures.push_back(std::async(std::launch::async, std::move(task)));
    }

    std::vector<Settled<T>> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        try {
            results.emplace_back(future.get());
        } catch (...) {
            results.emplace_back(std::unexpected(std::current_exception()));
        }
    }
    return results;
}

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_SETTLE_HPP
