#include <gtest/gtest.h>
#include <vector>
#include "astrofield/core/frame_scheduler.hpp"

TEST(FrameQueueTest, RunsPendingCallbacksWithTimestamp) {
    FrameQueue queue;
    std::vector<double> seen;

    queue.requestFrame([&seen](double t) { seen.push_back(t); });
    queue.requestFrame([&seen](double t) { seen.push_back(t + 1.0); });
    EXPECT_EQ(queue.pendingCount(), 2u);

    EXPECT_EQ(queue.runFrame(16.0), 2u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_DOUBLE_EQ(seen[0], 16.0);
    EXPECT_DOUBLE_EQ(seen[1], 17.0);
    EXPECT_EQ(queue.pendingCount(), 0u);

    // One-shot: nothing left for the next frame
    EXPECT_EQ(queue.runFrame(32.0), 0u);
}

TEST(FrameQueueTest, CancelledCallbackNeverRuns) {
    FrameQueue queue;
    int calls = 0;

    FrameHandle h = queue.requestFrame([&calls](double) { ++calls; });
    queue.cancelFrame(h);
    queue.cancelFrame(h);  // twice is harmless

    EXPECT_EQ(queue.runFrame(0.0), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(FrameQueueTest, RequestsMadeDuringAFrameRunNextFrame) {
    FrameQueue queue;
    int calls = 0;

    std::function<void(double)> recurring = [&](double) {
        ++calls;
        queue.requestFrame(recurring);
    };
    queue.requestFrame(recurring);

    EXPECT_EQ(queue.runFrame(0.0), 1u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(queue.pendingCount(), 1u);

    EXPECT_EQ(queue.runFrame(16.0), 1u);
    EXPECT_EQ(calls, 2);
}

TEST(FrameQueueTest, CallbackCanCancelALaterOne) {
    FrameQueue queue;
    bool secondRan = false;
    FrameHandle second = 0;

    queue.requestFrame([&](double) { queue.cancelFrame(second); });
    second = queue.requestFrame([&secondRan](double) { secondRan = true; });

    EXPECT_EQ(queue.runFrame(0.0), 1u);
    EXPECT_FALSE(secondRan);
}

TEST(FrameQueueTest, HandlesAreUnique) {
    FrameQueue queue;
    FrameHandle a = queue.requestFrame([](double) {});
    FrameHandle b = queue.requestFrame([](double) {});
    EXPECT_NE(a, b);
}
