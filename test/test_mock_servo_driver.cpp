// test/test_mock_servo_driver.cpp
#include <gtest/gtest.h>

#include <stdexcept>

#include "pan_tilt_tracker/mock_servo_driver.hpp"

TEST(MockServoDriver, UnsetPortsReportNinety)
{
    MockServoDriver servo;
    EXPECT_EQ(servo.num_ports(), 4);
    for (int port = 0; port < servo.num_ports(); ++port) {
        EXPECT_EQ(servo.get_angle(port), 90);
    }
}

TEST(MockServoDriver, StoresLastCommand)
{
    MockServoDriver servo;
    servo.set_angle(1, 45);
    servo.set_angle(1, 120);
    EXPECT_EQ(servo.get_angle(1), 120);
    EXPECT_EQ(servo.get_angle(0), 90);
}

TEST(MockServoDriver, ClampsToAbsoluteRange)
{
    MockServoDriver servo;
    servo.set_angle(0, -20.0);
    EXPECT_EQ(servo.get_angle(0), 0);
    servo.set_angle(0, 250.0);
    EXPECT_EQ(servo.get_angle(0), 180);
}

TEST(MockServoDriver, TruncatesToWholeDegrees)
{
    MockServoDriver servo;
    servo.set_angle(2, 106.9);
    EXPECT_EQ(servo.get_angle(2), 106);
}

TEST(MockServoDriver, RejectsUnknownPorts)
{
    MockServoDriver servo(2);
    EXPECT_THROW(servo.set_angle(2, 90), std::out_of_range);
    EXPECT_THROW(servo.get_angle(-1), std::out_of_range);
}
