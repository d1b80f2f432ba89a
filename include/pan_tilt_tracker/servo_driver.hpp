// include/pan_tilt_tracker/servo_driver.hpp
#ifndef SERVO_DRIVER_HPP
#define SERVO_DRIVER_HPP

/**
 * @class ServoDriver
 * @brief Position-commanded servo outputs, addressed by port number.
 *
 * Implementations clamp every command to the servo's absolute [0, 180] degree
 * range and truncate it to a whole degree. The tracking logic is written only
 * against this interface.
 */
class ServoDriver
{
public:
    virtual ~ServoDriver() = default;

    /**
     * @brief Commands a joint to an angle.
     * @param port Servo output the joint is wired to.
     * @param angle Target angle in degrees.
     * @throws std::out_of_range if the port does not exist.
     * @throws std::runtime_error if the device rejects the command.
     */
    virtual void set_angle(int port, double angle) = 0;

    /**
     * @brief Returns the last angle commanded on a port, or 90 if it was never set.
     */
    virtual int get_angle(int port) const = 0;
};

#endif // SERVO_DRIVER_HPP
