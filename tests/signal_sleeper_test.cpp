#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <thread>
#include "signal_sleeper.hpp"

using namespace pgentry::probe;

TEST(SignalAwareSleeperTest, SleepsForTheDuration) {
    SignalAwareSleeper sleeper;

    auto start = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(sleeper.sleep(std::chrono::milliseconds(50)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(50));
}

TEST(SignalAwareSleeperTest, ReusableAcrossWaits) {
    SignalAwareSleeper sleeper;
    EXPECT_NO_THROW(sleeper.sleep(std::chrono::milliseconds(5)));
    EXPECT_NO_THROW(sleeper.sleep(std::chrono::milliseconds(5)));
}

TEST(SignalAwareSleeperTest, QueuedSignalEndsNextWait) {
    SignalAwareSleeper sleeper;

    // Delivered while no wait is pending, as during a connection attempt
    std::raise(SIGTERM);

    auto start = std::chrono::steady_clock::now();
    try {
        sleeper.sleep(std::chrono::seconds(10));
        FAIL() << "Expected Interrupted";
    } catch (const Interrupted& e) {
        EXPECT_EQ(e.signal(), SIGTERM);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(SignalAwareSleeperTest, SignalDuringWait) {
    SignalAwareSleeper sleeper;

    std::thread killer([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::raise(SIGINT);
    });

    EXPECT_THROW(sleeper.sleep(std::chrono::seconds(10)), Interrupted);
    killer.join();
}
