// include/pan_tilt_tracker/axis_controller.hpp
#ifndef AXIS_CONTROLLER_HPP
#define AXIS_CONTROLLER_HPP

#include "pan_tilt_tracker/servo_driver.hpp"
#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @class AxisController
 * @brief Proportional controller for one joint of the pan-tilt head.
 *
 * The controller keeps no state of its own: the caller owns the AxisState and
 * passes it in each frame. Angles accumulate unrounded; only the value sent to
 * the servo is rounded to a whole degree.
 */
class AxisController
{
public:
    /**
     * @param config Limits and tuning of the axis.
     * @param servo Driver the joint is wired to. Must outlive the controller.
     * @param port Servo port of the joint.
     */
    AxisController(const AxisConfig &config, ServoDriver &servo, int port);

    /**
     * @brief Applies one proportional correction and commands the servo.
     * @param state Current angle of the axis.
     * @param error Normalized positional error of the target on this axis.
     * @return The new, clamped and unrounded, axis state.
     */
    AxisState step(const AxisState &state, double error) const;

    /**
     * @brief Sends an angle to the servo, rounded half away from zero.
     * @return The whole-degree angle that was commanded.
     */
    int command(double angle) const;

    /**
     * @brief Computes the next clamped angle without touching the servo.
     */
    static double next_angle(double current_angle, const AxisConfig &config, double error);

    /// Whole-degree value sent to the servo for an angle.
    static int to_command(double angle);

    /// Clamps an angle to the configured [min_angle, max_angle] range.
    static double clamp_angle(double angle, const AxisConfig &config);

    const AxisConfig &config() const { return config_; }
    int port() const { return port_; }

private:
    AxisConfig config_;
    ServoDriver &servo_;
    int port_;
};

#endif // AXIS_CONTROLLER_HPP
