// include/pan_tilt_tracker/pca9685_servo_driver.hpp
#ifndef PCA9685_SERVO_DRIVER_HPP
#define PCA9685_SERVO_DRIVER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "pan_tilt_tracker/servo_driver.hpp"

/**
 * @brief Wiring and pulse calibration of a PCA9685 servo board.
 */
struct Pca9685Options {
    std::string i2c_device = "/dev/i2c-1";
    int i2c_address = 0x40;
    int channels = 16;
    int min_pulse_us = 750;  ///< Pulse width at 0 degrees.
    int max_pulse_us = 2250; ///< Pulse width at 180 degrees.
};

/**
 * @class Pca9685ServoDriver
 * @brief Drives hobby servos from a PCA9685 16-channel PWM controller over Linux i2c-dev.
 *
 * The board runs at 50 Hz. Opening the driver wakes the chip and moves every
 * channel to 90 degrees. The device file is closed on destruction; the outputs
 * keep their last pulse.
 */
class Pca9685ServoDriver : public ServoDriver
{
public:
    /**
     * @brief Opens the I2C bus and configures the board.
     * @throws std::runtime_error if the bus cannot be opened or the chip does not respond.
     */
    explicit Pca9685ServoDriver(const Pca9685Options &options);
    ~Pca9685ServoDriver() override;

    Pca9685ServoDriver(const Pca9685ServoDriver &) = delete;
    Pca9685ServoDriver &operator=(const Pca9685ServoDriver &) = delete;

    void set_angle(int port, double angle) override;
    int get_angle(int port) const override;

private:
    void write_register(uint8_t reg, uint8_t value);
    void write_pulse(int channel, uint16_t off_ticks);
    uint16_t angle_to_ticks(int angle) const;

    Pca9685Options options_;
    int i2c_fd_;
    std::vector<int> angles_; ///< Last commanded angle per channel, -1 if never set.
};

#endif // PCA9685_SERVO_DRIVER_HPP
