// src/pca9685_servo_driver.cpp
#include "pan_tilt_tracker/pca9685_servo_driver.hpp"
#include "pan_tilt_tracker/constants.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

// PCA9685 registers
const uint8_t REG_MODE1 = 0x00;
const uint8_t REG_LED0_ON_L = 0x06;
const uint8_t REG_PRESCALE = 0xFE;

const uint8_t MODE1_SLEEP = 0x10;
const uint8_t MODE1_AUTO_INCREMENT = 0x20;
const uint8_t MODE1_RESTART = 0x80;

const double OSCILLATOR_HZ = 25000000.0;
const double PWM_FREQUENCY_HZ = 50.0;
const double PWM_PERIOD_US = 1000000.0 / PWM_FREQUENCY_HZ;
const int PWM_RESOLUTION = 4096;

} // namespace

Pca9685ServoDriver::Pca9685ServoDriver(const Pca9685Options &options)
    : options_(options), i2c_fd_(-1),
      angles_(static_cast<size_t>(std::max(options.channels, 0)), -1)
{
    if (options_.channels <= 0 || options_.channels > 16) {
        throw std::invalid_argument("PCA9685 channel count must be between 1 and 16.");
    }
    if (options_.min_pulse_us <= 0 || options_.max_pulse_us <= options_.min_pulse_us) {
        throw std::invalid_argument("PCA9685 pulse range must satisfy 0 < min_pulse_us < max_pulse_us.");
    }

    i2c_fd_ = open(options_.i2c_device.c_str(), O_RDWR);
    if (i2c_fd_ < 0) {
        throw std::runtime_error("Failed to open I2C bus " + options_.i2c_device + ": " + strerror(errno));
    }
    if (ioctl(i2c_fd_, I2C_SLAVE, options_.i2c_address) < 0) {
        std::string reason = strerror(errno);
        close(i2c_fd_);
        i2c_fd_ = -1;
        throw std::runtime_error("Failed to select PCA9685 at address " + std::to_string(options_.i2c_address) + ": " + reason);
    }

    try {
        // The prescaler can only be written while the oscillator sleeps.
        uint8_t prescale = static_cast<uint8_t>(
            std::lround(OSCILLATOR_HZ / (PWM_RESOLUTION * PWM_FREQUENCY_HZ)) - 1);
        write_register(REG_MODE1, MODE1_SLEEP);
        write_register(REG_PRESCALE, prescale);
        write_register(REG_MODE1, 0x00);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        write_register(REG_MODE1, MODE1_RESTART | MODE1_AUTO_INCREMENT);

        for (int channel = 0; channel < options_.channels; ++channel) {
            set_angle(channel, SERVO_DEFAULT_ANGLE);
        }
    } catch (const std::exception &) {
        close(i2c_fd_);
        i2c_fd_ = -1;
        throw;
    }
}

Pca9685ServoDriver::~Pca9685ServoDriver()
{
    if (i2c_fd_ >= 0) {
        close(i2c_fd_);
    }
}

void Pca9685ServoDriver::set_angle(int port, double angle)
{
    if (port < 0 || port >= options_.channels) {
        throw std::out_of_range("PCA9685 channel " + std::to_string(port) + " does not exist.");
    }
    double clamped = std::max(static_cast<double>(SERVO_ABSOLUTE_MIN_ANGLE),
                              std::min(static_cast<double>(SERVO_ABSOLUTE_MAX_ANGLE), angle));
    int degrees = static_cast<int>(clamped);
    write_pulse(port, angle_to_ticks(degrees));
    angles_[port] = degrees;
}

int Pca9685ServoDriver::get_angle(int port) const
{
    if (port < 0 || port >= options_.channels) {
        throw std::out_of_range("PCA9685 channel " + std::to_string(port) + " does not exist.");
    }
    return angles_[port] < 0 ? SERVO_DEFAULT_ANGLE : angles_[port];
}

void Pca9685ServoDriver::write_register(uint8_t reg, uint8_t value)
{
    uint8_t buffer[2] = {reg, value};
    if (write(i2c_fd_, buffer, sizeof(buffer)) != static_cast<ssize_t>(sizeof(buffer))) {
        throw std::runtime_error("PCA9685 register write failed: " + std::string(strerror(errno)));
    }
}

void Pca9685ServoDriver::write_pulse(int channel, uint16_t off_ticks)
{
    // ON at tick 0, OFF at off_ticks; auto-increment covers the four LEDn registers.
    uint8_t buffer[5] = {
        static_cast<uint8_t>(REG_LED0_ON_L + 4 * channel),
        0x00,
        0x00,
        static_cast<uint8_t>(off_ticks & 0xFF),
        static_cast<uint8_t>((off_ticks >> 8) & 0x0F)};
    if (write(i2c_fd_, buffer, sizeof(buffer)) != static_cast<ssize_t>(sizeof(buffer))) {
        throw std::runtime_error("PCA9685 write to channel " + std::to_string(channel) +
                                 " failed: " + strerror(errno));
    }
}

uint16_t Pca9685ServoDriver::angle_to_ticks(int angle) const
{
    double fraction = static_cast<double>(angle) / SERVO_ABSOLUTE_MAX_ANGLE;
    double pulse_us = options_.min_pulse_us + fraction * (options_.max_pulse_us - options_.min_pulse_us);
    return static_cast<uint16_t>(std::lround(pulse_us / PWM_PERIOD_US * PWM_RESOLUTION));
}
