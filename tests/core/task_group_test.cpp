#include "d2p/core/task_group.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using d2p::core::StopToken;
using d2p::core::TaskGroup;
using namespace std::chrono_literals;

TEST(StopToken, SleepRunsFullDurationWithoutStop) {
    StopToken token;

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.sleep_for(50ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 45ms);
    EXPECT_FALSE(token.stop_requested());
}

TEST(StopToken, RequestStopWakesSleeper) {
    StopToken token;
    std::atomic<bool> completed_full_sleep{true};

    std::thread sleeper([&]() {
        completed_full_sleep = token.sleep_for(10s);
    });

    std::this_thread::sleep_for(20ms);
    auto start = std::chrono::steady_clock::now();
    token.request_stop();
    sleeper.join();

    EXPECT_FALSE(completed_full_sleep);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(token.stop_requested());
}

TEST(TaskGroup, RunsSpawnedTasks) {
    TaskGroup group;
    std::atomic<int> ran{0};

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(group.spawn("counter", [&ran](const StopToken&) { ++ran; }));
    }

    group.shutdown();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(group.active(), 0u);
}

TEST(TaskGroup, ShutdownInterruptsSleepingTasks) {
    TaskGroup group;
    std::atomic<int> interrupted{0};

    for (int i = 0; i < 3; ++i) {
        group.spawn("sleeper", [&interrupted](const StopToken& stop) {
            if (!stop.sleep_for(30s)) {
                ++interrupted;
            }
        });
    }

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(group.active(), 3u);

    auto start = std::chrono::steady_clock::now();
    group.shutdown();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(interrupted.load(), 3);
}

TEST(TaskGroup, SpawnAfterShutdownIsRefused) {
    TaskGroup group;
    group.shutdown();

    std::atomic<bool> ran{false};
    EXPECT_FALSE(group.spawn("late", [&ran](const StopToken&) { ran = true; }));

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(ran);
}

TEST(TaskGroup, ThrowingTaskDoesNotAffectOthers) {
    TaskGroup group;
    std::atomic<bool> other_ran{false};

    group.spawn("thrower", [](const StopToken&) { throw std::runtime_error("boom"); });
    group.spawn("other", [&other_ran](const StopToken&) { other_ran = true; });

    group.shutdown();
    EXPECT_TRUE(other_ran);
}

TEST(TaskGroup, TasksCanSpawnFurtherTasks) {
    TaskGroup group;
    std::atomic<bool> child_ran{false};

    group.spawn("parent", [&group, &child_ran](const StopToken&) {
        group.spawn("child", [&child_ran](const StopToken&) { child_ran = true; });
    });

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!child_ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    group.shutdown();
    EXPECT_TRUE(child_ran);
}
