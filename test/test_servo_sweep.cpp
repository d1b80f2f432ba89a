// test/test_servo_sweep.cpp
#include <gtest/gtest.h>

#include <stdexcept>

#include "pan_tilt_tracker/servo_sweep.hpp"
#include "recording_servo_driver.hpp"

namespace {

SweepPlan quick_plan()
{
    SweepPlan plan;
    plan.pan_port = 0;
    plan.tilt_port = 1;
    plan.pan = AxisConfig{90, 30, 50, 0.55, 0.05, false};
    plan.tilt = AxisConfig{90, 80, 95, 0.55, 0.05, false};
    plan.step_degrees = 5;
    plan.step_delay = std::chrono::milliseconds(0);
    return plan;
}

} // namespace

TEST(ServoSweep, OnePassWalksPanThenTilt)
{
    RecordingServoDriver servo;
    ServoSweep sweep(servo, quick_plan(), []() { return true; });

    EXPECT_TRUE(sweep.run_once());

    EXPECT_EQ(servo.commands_for(0), (std::vector<int>{30, 35, 40, 45, 50, 50, 45, 40, 35, 30}));
    EXPECT_EQ(servo.commands_for(1), (std::vector<int>{80, 85, 90, 95, 95, 90, 85, 80}));
    // Pan finishes before tilt starts.
    EXPECT_EQ(servo.commands.front().first, 0);
    EXPECT_EQ(servo.commands.back().first, 1);
}

TEST(ServoSweep, StopsWhenAskedAndCenters)
{
    RecordingServoDriver servo;
    int steps_left = 3;
    ServoSweep sweep(servo, quick_plan(), [&steps_left]() { return steps_left-- > 0; });

    EXPECT_FALSE(sweep.run_once());
    EXPECT_EQ(servo.commands.size(), 3u);

    sweep.center();
    EXPECT_EQ(servo.get_angle(0), 90);
    EXPECT_EQ(servo.get_angle(1), 90);
}

TEST(ServoSweep, RejectsNonPositiveStep)
{
    RecordingServoDriver servo;
    SweepPlan plan = quick_plan();
    plan.step_degrees = 0;
    EXPECT_THROW(ServoSweep(servo, plan, []() { return true; }), std::invalid_argument);
}
