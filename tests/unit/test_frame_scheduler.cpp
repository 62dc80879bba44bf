#include <gtest/gtest.h>

#include "anim/frame_scheduler.hpp"

using namespace sheetscape;

TEST(FrameScheduler, StepAccumulates)
{
    FrameScheduler s;
    s.step(0.016f);
    s.step(0.016f);
    EXPECT_EQ(s.frame_number(), 2u);
    EXPECT_FLOAT_EQ(s.dt(), 0.016f);
    EXPECT_NEAR(s.current_frame().elapsed_sec, 0.032f, 1e-6f);
    EXPECT_EQ(s.hitch_count(), 0u);
}

TEST(FrameScheduler, StallIsClamped)
{
    FrameScheduler s(60.0f);
    s.step(3.0f);
    EXPECT_FLOAT_EQ(s.dt(), FrameScheduler::MAX_DT);
    EXPECT_EQ(s.hitch_count(), 1u);
}

TEST(FrameScheduler, NegativeTimeIsZero)
{
    FrameScheduler s;
    s.step(-1.0f);
    EXPECT_FLOAT_EQ(s.dt(), 0.0f);
}

TEST(FrameScheduler, FixedTimestepOverridesRawTime)
{
    FrameScheduler s;
    s.set_fixed_timestep(0.01f);
    EXPECT_TRUE(s.has_fixed_timestep());
    s.step(0.2f);
    EXPECT_FLOAT_EQ(s.dt(), 0.01f);

    s.clear_fixed_timestep();
    s.step(0.02f);
    EXPECT_FLOAT_EQ(s.dt(), 0.02f);

    s.set_fixed_timestep(-1.0f);
    EXPECT_FALSE(s.has_fixed_timestep());
}

TEST(FrameScheduler, FirstWallClockFrameHasZeroDt)
{
    FrameScheduler s(0.0f, FrameScheduler::Mode::Uncapped);
    s.begin_frame();
    EXPECT_FLOAT_EQ(s.dt(), 0.0f);
    EXPECT_EQ(s.frame_number(), 0u);
    s.end_frame();

    s.begin_frame();
    EXPECT_EQ(s.frame_number(), 1u);
    EXPECT_GE(s.dt(), 0.0f);
    EXPECT_LE(s.dt(), FrameScheduler::MAX_DT);
}

TEST(FrameScheduler, ResetClearsCounters)
{
    FrameScheduler s;
    s.step(1.0f);
    s.reset();
    EXPECT_EQ(s.frame_number(), 0u);
    EXPECT_EQ(s.hitch_count(), 0u);
}

TEST(FrameScheduler, IgnoresNonPositiveTargetFps)
{
    FrameScheduler s(30.0f);
    s.set_target_fps(0.0f);
    EXPECT_FLOAT_EQ(s.target_fps(), 30.0f);
}
