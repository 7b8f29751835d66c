#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "task_pool.hh"

TEST(TaskPoolTest, ResultsKeepTaskOrder) {
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 100; ++i) {
        tasks.emplace_back([i] {
            // later tasks finish first
            std::this_thread::sleep_for(std::chrono::microseconds((100 - i) * 10));
            return i * i;
        });
    }

    const auto results = fscmp::run_all(tasks, 8);

    ASSERT_EQ(results.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(results[i].value(), i * i);
    }
}

TEST(TaskPoolTest, FailureStaysInItsSlot) {
    std::vector<std::function<int()>> tasks;
    tasks.emplace_back([] { return 1; });
    tasks.emplace_back([]() -> int { throw std::runtime_error("boom"); });
    tasks.emplace_back([] { return 3; });

    const auto results = fscmp::run_all(tasks, 2);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].value(), 1);
    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].error(), "boom");
    EXPECT_TRUE(results[2].ok());
    EXPECT_EQ(results[2].value(), 3);
}

TEST(TaskPoolTest, NeverExceedsWorkerCount) {
    std::atomic<int> running(0);
    std::atomic<int> peak(0);
    std::vector<std::function<bool()>> tasks;
    for (int i = 0; i < 40; ++i) {
        tasks.emplace_back([&] {
            const auto now = ++running;
            auto prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --running;
            return true;
        });
    }

    const auto results = fscmp::run_all(tasks, 3);

    EXPECT_EQ(results.size(), 40u);
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(TaskPoolTest, ProgressSeesEveryCompletion) {
    std::vector<std::function<int()>> tasks(25, [] { return 0; });
    std::atomic<std::size_t> calls(0);
    std::atomic<std::size_t> last_total(0);

    fscmp::run_all(tasks, 4, [&](std::size_t, std::size_t total) {
        ++calls;
        last_total = total;
    });

    EXPECT_EQ(calls.load(), 25u);
    EXPECT_EQ(last_total.load(), 25u);
}

TEST(TaskPoolTest, EmptyTaskList) {
    const std::vector<std::function<int()>> tasks;

    EXPECT_TRUE(fscmp::run_all(tasks, 8).empty());
}

TEST(TaskPoolTest, ZeroWorkersRejected) {
    const std::vector<std::function<int()>> tasks(1, [] { return 0; });

    EXPECT_THROW(fscmp::run_all(tasks, 0), std::invalid_argument);
}
