#include "ticker.h"
#include <gtest/gtest.h>

TEST(FixedTicker, AccumulatesPartialFrames) {
    FixedTicker ticker(0.25f);
    EXPECT_EQ(ticker.advance(0.125f), 0);
    EXPECT_EQ(ticker.accumulator(), 0.125f);
    EXPECT_EQ(ticker.advance(0.125f), 1);
    EXPECT_EQ(ticker.accumulator(), 0.0f);
}

TEST(FixedTicker, CarriesRemainder) {
    FixedTicker ticker(0.0625f);
    EXPECT_EQ(ticker.advance(0.09375f), 1);
    EXPECT_EQ(ticker.accumulator(), 0.03125f);
    EXPECT_EQ(ticker.advance(0.03125f), 1);
}

TEST(FixedTicker, LongFramesAreCapped) {
    FixedTicker ticker(0.25f, 0.5f, 8);
    EXPECT_EQ(ticker.advance(10.0f), 2);
    EXPECT_EQ(ticker.accumulator(), 0.0f);
}

TEST(FixedTicker, TicksPerFrameAreBoundedAndBacklogDropped) {
    FixedTicker ticker(0.0625f, 1.0f, 4);
    EXPECT_EQ(ticker.advance(1.0f), 4);
    EXPECT_EQ(ticker.accumulator(), 0.0f);
    EXPECT_EQ(ticker.advance(0.0625f), 1);
}

TEST(FixedTicker, NegativeFrameTimeIsIgnored) {
    FixedTicker ticker(0.25f);
    EXPECT_EQ(ticker.advance(-1.0f), 0);
    EXPECT_EQ(ticker.accumulator(), 0.0f);
}

TEST(FixedTicker, ResetDropsAccumulatedTime) {
    FixedTicker ticker(0.25f);
    ticker.advance(0.2f);
    ticker.reset();
    EXPECT_EQ(ticker.advance(0.1f), 0);
}
