// include/pan_tilt_tracker/mock_servo_driver.hpp
#ifndef MOCK_SERVO_DRIVER_HPP
#define MOCK_SERVO_DRIVER_HPP

#include <vector>

#include "pan_tilt_tracker/constants.hpp"
#include "pan_tilt_tracker/servo_driver.hpp"

/**
 * @class MockServoDriver
 * @brief In-memory servo driver for running without hardware.
 *
 * Follows the same clamping and truncation contract as the hardware driver.
 */
class MockServoDriver : public ServoDriver
{
public:
    explicit MockServoDriver(int num_ports = DEFAULT_SERVO_PORTS);

    void set_angle(int port, double angle) override;
    int get_angle(int port) const override;

    int num_ports() const { return static_cast<int>(angles_.size()); }

private:
    std::vector<int> angles_;
};

#endif // MOCK_SERVO_DRIVER_HPP
