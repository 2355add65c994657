#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "audio/frame_queue.hpp"
#include "test_fakes.hpp"

using namespace std::chrono_literals;

TEST(FrameQueue, PopsInPushOrder) {
    FrameQueue queue;
    for (int16_t i = 1; i <= 5; ++i) queue.push(makeFrame(i, 4));

    Frame f;
    for (int16_t i = 1; i <= 5; ++i) {
        ASSERT_TRUE(queue.pop(f, 10ms));
        EXPECT_EQ(f[0], i);
    }
    EXPECT_EQ(queue.size(), 0u);
}

TEST(FrameQueue, PopTimesOutOnEmptyQueue) {
    FrameQueue queue;
    Frame f;

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(f, 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 25ms);
}

TEST(FrameQueue, AcceptsFramesOfAnyLength) {
    FrameQueue queue;
    queue.push(makeFrame(1, 3));
    queue.push(Frame{});

    Frame f;
    ASSERT_TRUE(queue.pop(f, 10ms));
    EXPECT_EQ(f.size(), 3u);
    ASSERT_TRUE(queue.pop(f, 10ms));
    EXPECT_TRUE(f.empty());
}

TEST(FrameQueue, TracksHighWaterMark) {
    FrameQueue queue;
    for (int i = 0; i < 7; ++i) queue.push(makeFrame(1, 2));

    Frame f;
    for (int i = 0; i < 4; ++i) queue.pop(f, 10ms);
    queue.push(makeFrame(1, 2));

    EXPECT_EQ(queue.size(), 4u);
    EXPECT_EQ(queue.highWaterMark(), 7u);

    queue.clear();
    EXPECT_EQ(queue.size(), 0u);
}

TEST(FrameQueue, WakesWaitingConsumer) {
    FrameQueue queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        queue.push(makeFrame(42, 2));
    });

    Frame f;
    EXPECT_TRUE(queue.pop(f, 2000ms));
    EXPECT_EQ(f[0], 42);
    producer.join();
}

TEST(FrameQueue, PreservesOrderAcrossThreads) {
    FrameQueue queue;
    const int count = 2000;

    std::thread producer([&] {
        for (int i = 0; i < count; ++i) queue.push(makeFrame((int16_t)(i % 30000), 1));
    });

    Frame f;
    for (int i = 0; i < count; ++i) {
        ASSERT_TRUE(queue.pop(f, 2000ms));
        ASSERT_EQ(f[0], (int16_t)(i % 30000));
    }
    producer.join();
}
