// test/test_scan_controller.cpp
#include <gtest/gtest.h>

#include <limits>

#include "pan_tilt_tracker/scan_controller.hpp"

namespace {

AxisConfig pan_config()
{
    AxisConfig config;
    config.center_angle = 90;
    config.min_angle = 30;
    config.max_angle = 150;
    return config;
}

} // namespace

TEST(ScanController, ActivatesOnlyAtMissThreshold)
{
    ScanController scan(10, 2.0);
    ScanState state;

    state.frames_since_target = 9;
    EXPECT_FALSE(scan.is_active(state));
    state.frames_since_target = 10;
    EXPECT_TRUE(scan.is_active(state));
    state.frames_since_target = 11;
    EXPECT_TRUE(scan.is_active(state));
}

TEST(ScanController, RecordMissCountsUpAndKeepsDirection)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.frames_since_target = 4;
    state.direction = -1;

    ScanState next = scan.record_miss(state);

    EXPECT_EQ(next.frames_since_target, 5u);
    EXPECT_EQ(next.direction, -1);
}

TEST(ScanController, MissCounterSaturatesAndStaysActive)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.frames_since_target = std::numeric_limits<unsigned int>::max() - 1;

    state = scan.record_miss(state);
    EXPECT_EQ(state.frames_since_target, std::numeric_limits<unsigned int>::max());

    state = scan.record_miss(state);
    EXPECT_EQ(state.frames_since_target, std::numeric_limits<unsigned int>::max());
    EXPECT_TRUE(scan.is_active(state));
}

TEST(ScanController, StepsInCurrentDirection)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.direction = -1;

    ScanStep next = scan.tick(state, AxisState{90.0}, pan_config());

    EXPECT_DOUBLE_EQ(next.pan.current_angle, 88.0);
    EXPECT_EQ(next.scan.direction, -1);
}

TEST(ScanController, ReversesExactlyAtMaxAngle)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.direction = 1;

    ScanStep next = scan.tick(state, AxisState{149.0}, pan_config());

    EXPECT_DOUBLE_EQ(next.pan.current_angle, 150.0);
    EXPECT_EQ(next.scan.direction, -1);
}

TEST(ScanController, ReversesExactlyAtMinAngle)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.direction = -1;

    ScanStep next = scan.tick(state, AxisState{31.0}, pan_config());

    EXPECT_DOUBLE_EQ(next.pan.current_angle, 30.0);
    EXPECT_EQ(next.scan.direction, 1);
}

TEST(ScanController, TwentyTicksFromNearMaxTurnAroundAndDescend)
{
    ScanController scan(10, 2.0);
    ScanState state;
    state.direction = 1;
    AxisState pan{149.0};

    ScanStep first = scan.tick(state, pan, pan_config());
    EXPECT_DOUBLE_EQ(first.pan.current_angle, 150.0);
    EXPECT_EQ(first.scan.direction, -1);

    state = first.scan;
    pan = first.pan;
    for (int tick = 2; tick <= 20; ++tick)
    {
        ScanStep next = scan.tick(state, pan, pan_config());
        EXPECT_DOUBLE_EQ(next.pan.current_angle, pan.current_angle - 2.0);
        EXPECT_EQ(next.scan.direction, -1);
        state = next.scan;
        pan = next.pan;
    }
    EXPECT_DOUBLE_EQ(pan.current_angle, 112.0);
}

TEST(ScanController, KeepsMissCounter)
{
    ScanController scan(3, 5.0);
    ScanState state;
    state.frames_since_target = 42;

    ScanStep next = scan.tick(state, AxisState{90.0}, pan_config());

    EXPECT_EQ(next.scan.frames_since_target, 42u);
}
