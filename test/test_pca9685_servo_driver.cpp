// test/test_pca9685_servo_driver.cpp
#include <gtest/gtest.h>

#include <stdexcept>

#include "pan_tilt_tracker/pca9685_servo_driver.hpp"

TEST(Pca9685ServoDriver, MissingBusThrowsRuntimeError)
{
    Pca9685Options options;
    options.i2c_device = "/nonexistent/pan_tilt_i2c";

    EXPECT_THROW(Pca9685ServoDriver driver(options), std::runtime_error);
}

TEST(Pca9685ServoDriver, RejectsChannelCountOutsideBoard)
{
    Pca9685Options options;
    options.i2c_device = "/nonexistent/pan_tilt_i2c";
    options.channels = 0;
    EXPECT_THROW(Pca9685ServoDriver driver(options), std::invalid_argument);

    options.channels = 17;
    EXPECT_THROW(Pca9685ServoDriver driver(options), std::invalid_argument);
}

TEST(Pca9685ServoDriver, RejectsInvertedPulseRange)
{
    Pca9685Options options;
    options.i2c_device = "/nonexistent/pan_tilt_i2c";
    options.min_pulse_us = 2000;
    options.max_pulse_us = 1000;

    EXPECT_THROW(Pca9685ServoDriver driver(options), std::invalid_argument);
}
