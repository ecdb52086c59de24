#include <gtest/gtest.h>
#include "rate_meter.hpp"

using namespace std::chrono;

TEST(SampleRateMeter, ZeroUntilTwoTicks)
{
    SampleRateMeter meter;
    EXPECT_EQ(meter.rate(), 0.0);
    meter.tick(SampleRateMeter::Clock::time_point(seconds(1)));
    EXPECT_EQ(meter.rate(), 0.0);
    EXPECT_EQ(meter.samples(), 0u);
}

TEST(SampleRateMeter, RateIsInverseMeanInterval)
{
    SampleRateMeter meter(200);
    SampleRateMeter::Clock::time_point t(seconds(10));
    for (int i = 0; i < 11; ++i)
    {
        meter.tick(t);
        t += milliseconds(10);
    }
    EXPECT_EQ(meter.samples(), 10u);
    EXPECT_NEAR(meter.rate(), 100.0, 1e-6);
}

TEST(SampleRateMeter, OnlyRecentWindowCounts)
{
    SampleRateMeter meter(4);
    SampleRateMeter::Clock::time_point t(seconds(10));
    meter.tick(t);
    for (int i = 0; i < 10; ++i)
    {
        t += milliseconds(100); // 10 Hz
        meter.tick(t);
    }
    for (int i = 0; i < 4; ++i)
    {
        t += milliseconds(20); // 50 Hz
        meter.tick(t);
    }
    EXPECT_EQ(meter.samples(), 4u);
    EXPECT_NEAR(meter.rate(), 50.0, 1e-6);
}
