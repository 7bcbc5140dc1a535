#include <gtest/gtest.h>

#include "session/Cancellation.h"

#include <atomic>
#include <thread>

using quichat::session::CancellationToken;
using namespace std::chrono_literals;

TEST(Cancellation, WaitForTimesOutWhileNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.wait_for(10ms));
    EXPECT_FALSE(token.cancelled());
}

TEST(Cancellation, CancelWakesWaiterPromptly) {
    CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
}

TEST(Cancellation, CallbacksRunOnce) {
    CancellationToken token;
    std::atomic<int> calls{0};
    CancellationToken::Registration reg(token, [&] { ++calls; });
    token.cancel();
    token.cancel();
    EXPECT_EQ(calls.load(), 1);
}

TEST(Cancellation, LateRegistrationRunsInline) {
    CancellationToken token;
    token.cancel();
    bool called = false;
    CancellationToken::Registration reg(token, [&] { called = true; });
    EXPECT_TRUE(called);
}

TEST(Cancellation, DroppedRegistrationIsNotCalled) {
    CancellationToken token;
    bool called = false;
    {
        CancellationToken::Registration reg(token, [&] { called = true; });
    }
    token.cancel();
    EXPECT_FALSE(called);
}
