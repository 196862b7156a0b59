/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool and join_all.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace container_pulse;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            (void)pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(counter.load(), 10);
}

// ═══════════════════════════════════════════════
// join_all
// ═══════════════════════════════════════════════

TEST(JoinAllTest, CollectsEveryOutcomeInOrder) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool.submit([i] {
            if (i == 2) throw std::runtime_error("task 2 exploded");
            return i * 10;
        }));
    }

    auto outcomes = join_all(futures);
    ASSERT_EQ(outcomes.size(), 5u);
    EXPECT_EQ(*outcomes[0], 0);
    EXPECT_EQ(*outcomes[1], 10);
    ASSERT_FALSE(outcomes[2].has_value());
    EXPECT_EQ(outcomes[2].error().message, "task 2 exploded");
    EXPECT_EQ(*outcomes[3], 30);
    EXPECT_EQ(*outcomes[4], 40);
}

TEST(JoinAllTest, SlowTaskDoesNotHideFastFailure) {
    ThreadPool pool(2);
    std::vector<std::future<void>> futures;
    futures.push_back(pool.submit([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }));
    futures.push_back(pool.submit([] { throw std::runtime_error("refused"); }));

    auto outcomes = join_all(futures);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].has_value());
    EXPECT_FALSE(outcomes[1].has_value());
}
