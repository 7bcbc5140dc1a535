#include <gtest/gtest.h>

#include "session/TaskGroup.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

using quichat::session::CancellationToken;
using quichat::session::TaskGroup;
using namespace std::chrono_literals;

TEST(TaskGroup, JoinWaitsWithoutCancelling) {
    CancellationToken token;
    std::atomic<int> done{0};
    {
        TaskGroup tasks(token);
        for (int i = 0; i < 3; ++i) tasks.spawn([&] { ++done; });
        EXPECT_EQ(tasks.size(), 3u);
        tasks.join();
        EXPECT_EQ(done.load(), 3);
    }
    EXPECT_FALSE(token.cancelled());
}

// Mirrors a session whose later spawn fails: the tasks already running
// must be stopped and joined, not left joinable.
TEST(TaskGroup, LeavingScopeEarlyCancelsAndJoins) {
    CancellationToken token;
    std::atomic<bool> woke{false};

    EXPECT_THROW({
        TaskGroup tasks(token);
        tasks.spawn([&] {
            woke = token.wait_for(10s);
        });
        throw std::runtime_error("could not start the second task");
    }, std::runtime_error);

    EXPECT_TRUE(token.cancelled());
    EXPECT_TRUE(woke.load());
}

TEST(TaskGroup, EmptyGroupIsHarmless) {
    CancellationToken token;
    {
        TaskGroup tasks(token);
    }
    EXPECT_FALSE(token.cancelled());
}
