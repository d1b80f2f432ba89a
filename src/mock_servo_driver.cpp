// src/mock_servo_driver.cpp
#include "pan_tilt_tracker/mock_servo_driver.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

MockServoDriver::MockServoDriver(int num_ports)
    : angles_(static_cast<size_t>(std::max(num_ports, 0)), SERVO_DEFAULT_ANGLE)
{
}

void MockServoDriver::set_angle(int port, double angle)
{
    if (port < 0 || port >= num_ports()) {
        throw std::out_of_range("Mock servo port " + std::to_string(port) + " does not exist.");
    }
    double clamped = std::max(static_cast<double>(SERVO_ABSOLUTE_MIN_ANGLE),
                              std::min(static_cast<double>(SERVO_ABSOLUTE_MAX_ANGLE), angle));
    angles_[port] = static_cast<int>(clamped);
}

int MockServoDriver::get_angle(int port) const
{
    if (port < 0 || port >= num_ports()) {
        throw std::out_of_range("Mock servo port " + std::to_string(port) + " does not exist.");
    }
    return angles_[port];
}
