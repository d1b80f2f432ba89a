// test/test_axis_controller.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "pan_tilt_tracker/axis_controller.hpp"
#include "recording_servo_driver.hpp"

namespace {

AxisConfig pan_config()
{
    AxisConfig config;
    config.center_angle = 90;
    config.min_angle = 30;
    config.max_angle = 150;
    config.gain = 0.55;
    config.deadzone = 0.05;
    config.invert = false;
    return config;
}

} // namespace

TEST(AxisController, ProportionalStepStoresUnroundedAndCommandsRounded)
{
    RecordingServoDriver servo;
    AxisController controller(pan_config(), servo, 0);

    AxisState next = controller.step(AxisState{90.0}, 0.5);

    EXPECT_DOUBLE_EQ(next.current_angle, 106.5);
    ASSERT_EQ(servo.commands.size(), 1u);
    EXPECT_EQ(servo.commands.back().first, 0);
    EXPECT_EQ(servo.commands.back().second, 107);
}

TEST(AxisController, AngleAccumulatesWithoutRoundingDrift)
{
    RecordingServoDriver servo;
    AxisController controller(pan_config(), servo, 0);

    // Each step moves 0.55 * 0.1 * 60 = 3.3 degrees.
    AxisState state{90.0};
    for (int i = 0; i < 3; ++i) {
        state = controller.step(state, 0.1);
    }

    EXPECT_NEAR(state.current_angle, 99.9, 1e-9);
    EXPECT_EQ(servo.commands_for(0), (std::vector<int>{93, 97, 100}));
}

TEST(AxisController, ErrorInsideDeadzoneLeavesAngleUnchanged)
{
    RecordingServoDriver servo;
    AxisController controller(pan_config(), servo, 0);

    AxisState next = controller.step(AxisState{101.25}, 0.049);
    EXPECT_DOUBLE_EQ(next.current_angle, 101.25);

    next = controller.step(AxisState{101.25}, -0.049);
    EXPECT_DOUBLE_EQ(next.current_angle, 101.25);
}

TEST(AxisController, ErrorInsideDeadzoneLeavesInvertedAxisUnchanged)
{
    AxisConfig config = pan_config();
    config.invert = true;
    RecordingServoDriver servo;
    AxisController controller(config, servo, 1);

    AxisState next = controller.step(AxisState{72.0}, 0.04);

    EXPECT_DOUBLE_EQ(next.current_angle, 72.0);
    EXPECT_EQ(servo.commands_for(1), (std::vector<int>{72}));
}

TEST(AxisController, ErrorAtDeadzoneBoundaryMoves)
{
    AxisConfig config = pan_config();
    config.deadzone = 0.25;
    EXPECT_GT(AxisController::next_angle(90.0, config, 0.25), 90.0);
}

TEST(AxisController, InvertReversesDirection)
{
    AxisConfig config = pan_config();
    config.invert = true;

    EXPECT_DOUBLE_EQ(AxisController::next_angle(90.0, config, 0.5), 73.5);
    EXPECT_DOUBLE_EQ(AxisController::next_angle(90.0, pan_config(), -0.5), 73.5);
}

TEST(AxisController, ClampsToConfiguredRange)
{
    RecordingServoDriver servo;
    AxisController controller(pan_config(), servo, 0);

    AxisState high = controller.step(AxisState{145.0}, 1.0);
    EXPECT_DOUBLE_EQ(high.current_angle, 150.0);
    EXPECT_EQ(servo.commands.back().second, 150);

    AxisState low = controller.step(AxisState{35.0}, -1.0);
    EXPECT_DOUBLE_EQ(low.current_angle, 30.0);
    EXPECT_EQ(servo.commands.back().second, 30);
}

TEST(AxisController, AngleStaysInRangeForArbitraryErrors)
{
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> error_dist(-3.0, 3.0);
    std::uniform_real_distribution<double> gain_dist(0.01, 2.0);
    std::uniform_int_distribution<int> bound_dist(0, 180);

    for (int config_index = 0; config_index < 50; ++config_index)
    {
        AxisConfig config;
        int a = bound_dist(rng);
        int b = bound_dist(rng);
        config.min_angle = std::min(a, b);
        config.max_angle = std::max(a, b);
        config.center_angle = (config.min_angle + config.max_angle) / 2;
        config.gain = gain_dist(rng);
        config.deadzone = 0.05;
        config.invert = (config_index % 2) == 1;

        RecordingServoDriver servo;
        AxisController controller(config, servo, 0);
        AxisState state{static_cast<double>(config.center_angle)};
        for (int frame = 0; frame < 100; ++frame)
        {
            state = controller.step(state, error_dist(rng));
            ASSERT_GE(state.current_angle, config.min_angle);
            ASSERT_LE(state.current_angle, config.max_angle);
            ASSERT_GE(servo.commands.back().second, config.min_angle);
            ASSERT_LE(servo.commands.back().second, config.max_angle);
        }
    }
}

TEST(AxisController, CommandRoundsHalfAwayFromZero)
{
    EXPECT_EQ(AxisController::to_command(106.5), 107);
    EXPECT_EQ(AxisController::to_command(106.49), 106);
    EXPECT_EQ(AxisController::to_command(30.0), 30);
}
