/**
 * @file collection_loop.hpp
 * @brief Fixed-interval driver for CollectionCycle.
 *
 * A single jthread runs a cycle, then waits until interval() has elapsed
 * since that cycle started. The next cycle cannot begin before the
 * previous one returned, so cycles never overlap. A cycle that overruns
 * its interval is followed immediately by the next one.
 */

#pragma once

#include "collector/collection_cycle.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace container_pulse {

class CollectionLoop {
public:
    /// Re-evaluated before every wait, so interval changes apply on the next tick.
    using IntervalFn = std::function<std::chrono::seconds()>;
    using ClockFn = std::function<TimestampMs()>;

    CollectionLoop(CollectionCycle& cycle,
                   IntervalFn interval,
                   Logger& logger,
                   ClockFn clock = [] { return now_ms(); });
    ~CollectionLoop();

    CollectionLoop(const CollectionLoop&) = delete;
    CollectionLoop& operator=(const CollectionLoop&) = delete;

    Result<void> start();

    /// Request stop and join; an in-flight cycle runs to completion first.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(); }

private:
    void loop(std::stop_token stop);

    CollectionCycle& cycle_;
    IntervalFn interval_;
    Logger& logger_;
    ClockFn clock_;

    std::jthread thread_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
};

}  // namespace container_pulse
