/**
 * @file test_signal_watcher.cpp
 * @brief Stop signals reach the run through the watcher thread
 */

#include <gtest/gtest.h>
#include "SignalWatcher.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

using namespace ParaCopy;

TEST(SignalWatcherTest, SignalRunsStopHandler) {
    std::atomic<int> received{0};
    SignalWatcher watcher([&](int signal) { received = signal; });

    ASSERT_EQ(::raise(SIGTERM), 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (received == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(received.load(), SIGTERM);
}

TEST(SignalWatcherTest, QuietRunNeverCallsHandler) {
    std::atomic<bool> called{false};
    {
        SignalWatcher watcher([&](int) { called = true; });
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
    }
    EXPECT_FALSE(called);
}

TEST(SignalWatcherTest, ExceptionLeavingScopeJoinsWatcher) {
    std::atomic<bool> called{false};
    EXPECT_THROW({
        SignalWatcher watcher([&](int) { called = true; });
        throw std::runtime_error("run failed");
    }, std::runtime_error);
    EXPECT_FALSE(called);
}
