// include/pan_tilt_tracker/servo_sweep.hpp
#ifndef SERVO_SWEEP_HPP
#define SERVO_SWEEP_HPP

#include <chrono>
#include <functional>

#include <rclcpp/rclcpp.hpp>

#include "pan_tilt_tracker/servo_driver.hpp"
#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief Joints and ranges exercised by a sweep.
 */
struct SweepPlan {
    int pan_port = 0;
    int tilt_port = 1;
    AxisConfig pan;
    AxisConfig tilt;
    int step_degrees = 5;
    std::chrono::milliseconds step_delay{50};
};

/**
 * @class ServoSweep
 * @brief Walks pan min -> max -> min, then tilt min -> max -> min, to check the wiring.
 */
class ServoSweep
{
public:
    /**
     * @param servo Driver to exercise. Must outlive the sweep.
     * @param plan Ports, ranges and pacing.
     * @param keep_running Polled between steps; the sweep stops early when it returns false.
     * @param logger Receives one line per pass and, at debug level, one per step.
     */
    ServoSweep(ServoDriver &servo, const SweepPlan &plan, std::function<bool()> keep_running,
               rclcpp::Logger logger = rclcpp::get_logger("servo_sweep"));

    /**
     * @brief Runs one full pan and tilt pass.
     * @return False if it was interrupted.
     */
    bool run_once();

    /// Moves both joints to their center angles.
    void center();

private:
    bool sweep_axis(int port, int from, int to);

    ServoDriver &servo_;
    SweepPlan plan_;
    std::function<bool()> keep_running_;
    rclcpp::Logger logger_;
};

#endif // SERVO_SWEEP_HPP
