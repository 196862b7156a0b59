/**
 * @file collection_loop.cpp
 * @brief CollectionLoop implementation.
 */

#include "collector/collection_loop.hpp"

#include "core/config.hpp"

namespace container_pulse {

CollectionLoop::CollectionLoop(CollectionCycle& cycle,
                               IntervalFn interval,
                               Logger& logger,
                               ClockFn clock)
    : cycle_(cycle)
    , interval_(std::move(interval))
    , logger_(logger)
    , clock_(std::move(clock)) {}

CollectionLoop::~CollectionLoop() {
    stop();
}

Result<void> CollectionLoop::start() {
    if (running_.exchange(true)) {
        return Error{"Collection loop already running"};
    }

    thread_ = std::jthread([this](std::stop_token stop) {
        loop(stop);
    });
    logger_.info("collection loop started");
    return Result<void>{};
}

void CollectionLoop::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.request_stop();
        wait_cv_.notify_all();
        thread_.join();
    }
    logger_.info("collection loop stopped after " + std::to_string(ticks_.load()) + " ticks");
}

void CollectionLoop::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        const auto started = std::chrono::steady_clock::now();

        auto report = cycle_.run(clock_());
        ticks_.fetch_add(1);
        if (report.outcome != CycleOutcome::Completed) {
            logger_.debug(std::string{"tick outcome: "} + std::string{to_string(report.outcome)});
        }

        const auto seconds = clamp_interval_seconds(interval_().count());
        const auto deadline = started + std::chrono::seconds(seconds);

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_until(lock, stop, deadline, [] { return false; });
    }
}

}  // namespace container_pulse
