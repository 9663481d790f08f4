#include "Utils/FPSCounter.hpp"
#include <gtest/gtest.h>

TEST(FPSCounter, StartsAtZero)
{
    FPSCounter counter;
    EXPECT_DOUBLE_EQ(counter.rate(), 0.0);
    EXPECT_EQ(counter.frameCount(), 0);
    EXPECT_FLOAT_EQ(counter.elapsed(), 0.f);
}

TEST(FPSCounter, SixtyHertzWindowReportsSixty)
{
    FPSCounter counter;
    for (int i = 0; i < 29; ++i) {
        EXPECT_FALSE(counter.onFrame(1.f / 60.f)) << "frame " << i;
    }
    EXPECT_DOUBLE_EQ(counter.rate(), 0.0);

    EXPECT_TRUE(counter.onFrame(1.f / 60.f));
    EXPECT_DOUBLE_EQ(counter.rate(), 60.0);
}

TEST(FPSCounter, ResetsTogetherAfterReport)
{
    FPSCounter counter;
    for (int i = 0; i < 3; ++i) counter.onFrame(0.125f);
    EXPECT_EQ(counter.frameCount(), 3);
    EXPECT_FLOAT_EQ(counter.elapsed(), 0.375f);

    ASSERT_TRUE(counter.onFrame(0.125f));
    EXPECT_EQ(counter.frameCount(), 0);
    EXPECT_FLOAT_EQ(counter.elapsed(), 0.f);
    EXPECT_DOUBLE_EQ(counter.rate(), 8.0);
}

TEST(FPSCounter, RateHeldUntilNextWindow)
{
    FPSCounter counter;
    for (int i = 0; i < 4; ++i) counter.onFrame(0.125f);
    ASSERT_DOUBLE_EQ(counter.rate(), 8.0);

    // Segunda ventana a 16 fps: el valor viejo se mantiene hasta cerrarla
    for (int i = 0; i < 7; ++i) {
        counter.onFrame(0.0625f);
        EXPECT_DOUBLE_EQ(counter.rate(), 8.0);
    }
    counter.onFrame(0.0625f);
    EXPECT_DOUBLE_EQ(counter.rate(), 16.0);
}

TEST(FPSCounter, PausedClockNeverReports)
{
    FPSCounter counter;
    for (int i = 0; i < 4; ++i) counter.onFrame(0.125f);
    ASSERT_DOUBLE_EQ(counter.rate(), 8.0);

    for (int i = 0; i < 10000; ++i) {
        EXPECT_FALSE(counter.onFrame(0.f));
    }
    EXPECT_DOUBLE_EQ(counter.rate(), 8.0);
    EXPECT_EQ(counter.frameCount(), 10000);
}

TEST(FPSCounter, RoundsHalfAwayFromZero)
{
    // 9 frames en 4s = 2.25 fps, el medio va para arriba
    FPSCounter counter;
    for (int i = 0; i < 8; ++i) counter.onFrame(0.f);
    ASSERT_TRUE(counter.onFrame(4.f));
    EXPECT_DOUBLE_EQ(counter.rate(), 2.3);

    // 1 frame en 4s = 0.25 fps
    ASSERT_TRUE(counter.onFrame(4.f));
    EXPECT_DOUBLE_EQ(counter.rate(), 0.3);
}

TEST(FPSCounter, RoundsToOneDecimal)
{
    // 7 frames en 0.75s = 9.333...
    FPSCounter counter;
    for (int i = 0; i < 6; ++i) counter.onFrame(0.f);
    ASSERT_TRUE(counter.onFrame(0.75f));
    EXPECT_DOUBLE_EQ(counter.rate(), 9.3);
}

TEST(FPSCounter, LongFrameReportsImmediately)
{
    FPSCounter counter;
    EXPECT_TRUE(counter.onFrame(2.f));
    EXPECT_DOUBLE_EQ(counter.rate(), 0.5);
}

class FPSCounterWindowTest : public ::testing::TestWithParam<int> {};

// N frames que suman exactamente 0.5s -> N / 0.5
TEST_P(FPSCounterWindowTest, ExactWindowGivesTwiceFrameCount)
{
    const int frames = GetParam();
    const float dt = FPSCounter::UpdateInterval / frames;

    FPSCounter counter;
    for (int i = 0; i < frames - 1; ++i) {
        ASSERT_FALSE(counter.onFrame(dt));
    }
    ASSERT_TRUE(counter.onFrame(dt));
    EXPECT_DOUBLE_EQ(counter.rate(), frames / 0.5);
}

INSTANTIATE_TEST_SUITE_P(PowerOfTwoFrames, FPSCounterWindowTest, ::testing::Values(1, 2, 4, 8, 16, 32, 64));
