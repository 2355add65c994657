#include <gtest/gtest.h>

#include "pipeline/pre_roll_buffer.hpp"
#include "test_fakes.hpp"

TEST(PreRollBuffer, NeverExceedsCapacity) {
    PreRollBuffer buffer(10);
    for (int16_t i = 0; i < 25; ++i) {
        buffer.push(makeFrame(i, 2));
        EXPECT_LE(buffer.size(), 10u);
    }
    EXPECT_EQ(buffer.size(), 10u);
}

TEST(PreRollBuffer, KeepsMostRecentFramesOldestFirst) {
    PreRollBuffer buffer(3);
    for (int16_t i = 1; i <= 5; ++i) buffer.push(makeFrame(i, 2));

    const auto frames = buffer.frames();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0][0], 3);
    EXPECT_EQ(frames[1][0], 4);
    EXPECT_EQ(frames[2][0], 5);
}

TEST(PreRollBuffer, SnapshotIsIndependentCopy) {
    PreRollBuffer buffer(2);
    buffer.push(makeFrame(1, 2));
    auto snapshot = buffer.frames();

    buffer.push(makeFrame(2, 2));
    buffer.push(makeFrame(3, 2));

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0][0], 1);
}

TEST(PreRollBuffer, ZeroCapacityHoldsNothing) {
    PreRollBuffer buffer(0);
    buffer.push(makeFrame(1, 2));
    EXPECT_TRUE(buffer.empty());
}

TEST(PreRollBuffer, ClearEmpties) {
    PreRollBuffer buffer(4);
    buffer.push(makeFrame(1, 2));
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.capacity(), 4u);
}
