/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool plus a wait-for-all combinator.
 *
 * Used for the per-PID reads of a collection cycle and for concurrent
 * webhook deliveries. join_all() never short-circuits: every future is
 * waited on and every outcome collected, so one failing task cannot hide
 * the others.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/result.hpp"

namespace container_pulse {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

/**
 * @brief Wait for every future and collect each outcome.
 *
 * An exception escaping a task becomes an Error entry at the task's index.
 */
template <typename T>
std::vector<Result<T>> join_all(std::vector<std::future<T>>& futures) {
    std::vector<Result<T>> outcomes;
    outcomes.reserve(futures.size());
    for (auto& future : futures) {
        try {
            if constexpr (std::is_void_v<T>) {
                future.get();
                outcomes.emplace_back();
            } else {
                outcomes.emplace_back(future.get());
            }
        } catch (const std::exception& ex) {
            outcomes.emplace_back(Error{ex.what()});
        } catch (...) {
            outcomes.emplace_back(Error{"task failed with a non-standard exception"});
        }
    }
    return outcomes;
}

}  // namespace container_pulse
