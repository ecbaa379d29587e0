#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

#include "../threads/PosixTimerTicker.hpp"

TEST(PosixTimerTicker, WaitFailsBeforeStart) {
    PosixTimerTicker ticker(10, SIGRTMIN);
    EXPECT_FALSE(ticker.wait());
}

TEST(PosixTimerTicker, DeliversPeriodicTicks) {
    PosixTimerTicker ticker(10, SIGRTMIN);
    ASSERT_TRUE(ticker.start());

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(ticker.wait());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_GE(elapsed, 15);
    EXPECT_LT(elapsed, 1000);
}
