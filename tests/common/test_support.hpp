#ifndef DEVPREVIEW_TESTS_TEST_SUPPORT_HPP
#define DEVPREVIEW_TESTS_TEST_SUPPORT_HPP

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "process/process_runner.hpp"

namespace devpreview::test {

inline auto makeNullLogger(const std::string& name = "test")
    -> std::shared_ptr<spdlog::logger> {
    return std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline auto ok(std::string out = {}) -> process::ProcessResult {
    process::ProcessResult result;
    result.exitCode = 0;
    result.stdOut = std::move(out);
    return result;
}

inline auto fail(int code, std::string err = {}, std::string out = {})
    -> process::ProcessResult {
    process::ProcessResult result;
    result.exitCode = code;
    result.stdOut = std::move(out);
    result.stdErr = std::move(err);
    return result;
}

/**
 * Scripted runner. Responses are keyed by command line prefix; the longest
 * matching prefix wins. Several responses for one prefix are returned in
 * order and the last one repeats.
 */
class FakeProcessRunner : public process::ProcessRunner {
public:
    void on(const std::string& commandPrefix, process::ProcessResult result) {
        std::lock_guard lock(mutex_);
        scripts_[commandPrefix].push_back(std::move(result));
    }

    void onSpawn(std::expected<int, process::ProcessError> result) {
        std::lock_guard lock(mutex_);
        spawnResult_ = result;
    }

    auto execute(const process::ProcessConfig& config)
        -> std::expected<process::ProcessResult, process::ProcessError>
        override {
        auto command = buildCommandLine(config);
        std::lock_guard lock(mutex_);
        calls_.push_back(command);

        auto best = scripts_.end();
        for (auto it = scripts_.begin(); it != scripts_.end(); ++it) {
            if (command.starts_with(it->first) &&
                (best == scripts_.end() || it->first.size() > best->first.size())) {
                best = it;
            }
        }
        if (best == scripts_.end()) {
            return fail(127, "command not scripted: " + command);
        }
        auto& queue = best->second;
        auto result = queue.front();
        if (queue.size() > 1) {
            queue.pop_front();
        }
        return result;
    }

    auto spawnDetached(const process::ProcessConfig& config)
        -> std::expected<int, process::ProcessError> override {
        std::lock_guard lock(mutex_);
        spawned_.push_back(buildCommandLine(config));
        return spawnResult_;
    }

    auto calls() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    auto spawned() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return spawned_;
    }

    auto countCalls(const std::string& prefix) const -> std::size_t {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(
            calls_.begin(), calls_.end(),
            [&prefix](const auto& call) { return call.starts_with(prefix); }));
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<process::ProcessResult>> scripts_;
    std::vector<std::string> calls_;
    std::vector<std::string> spawned_;
    std::expected<int, process::ProcessError> spawnResult_{4242};
};

/**
 * Clock that only moves when slept on or advanced.
 */
class ManualClock : public Clock {
public:
    auto now() const -> TimePoint override {
        std::lock_guard lock(mutex_);
        return current_;
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        std::lock_guard lock(mutex_);
        current_ += duration;
        ++sleeps_;
    }

    void advance(std::chrono::milliseconds duration) {
        std::lock_guard lock(mutex_);
        current_ += duration;
    }

    auto sleeps() const -> int {
        std::lock_guard lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    TimePoint current_{};
    int sleeps_{0};
};

}  // namespace devpreview::test

#endif  // DEVPREVIEW_TESTS_TEST_SUPPORT_HPP
