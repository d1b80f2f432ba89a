// src/servo_sweep.cpp
#include "pan_tilt_tracker/servo_sweep.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

ServoSweep::ServoSweep(ServoDriver &servo, const SweepPlan &plan, std::function<bool()> keep_running,
                       rclcpp::Logger logger)
    : servo_(servo), plan_(plan), keep_running_(std::move(keep_running)), logger_(logger)
{
    if (plan_.step_degrees <= 0) {
        throw std::invalid_argument("Sweep step must be positive.");
    }
}

bool ServoSweep::run_once()
{
    RCLCPP_INFO(logger_, "Sweeping pan %d -> %d -> %d ...", plan_.pan.min_angle, plan_.pan.max_angle, plan_.pan.min_angle);
    if (!sweep_axis(plan_.pan_port, plan_.pan.min_angle, plan_.pan.max_angle) ||
        !sweep_axis(plan_.pan_port, plan_.pan.max_angle, plan_.pan.min_angle)) {
        return false;
    }
    RCLCPP_INFO(logger_, "Sweeping tilt %d -> %d -> %d ...", plan_.tilt.min_angle, plan_.tilt.max_angle, plan_.tilt.min_angle);
    return sweep_axis(plan_.tilt_port, plan_.tilt.min_angle, plan_.tilt.max_angle) &&
           sweep_axis(plan_.tilt_port, plan_.tilt.max_angle, plan_.tilt.min_angle);
}

void ServoSweep::center()
{
    servo_.set_angle(plan_.pan_port, plan_.pan.center_angle);
    servo_.set_angle(plan_.tilt_port, plan_.tilt.center_angle);
}

bool ServoSweep::sweep_axis(int port, int from, int to)
{
    // Same stepping as a range walk: endpoints included only when the step lands on them.
    int step = from <= to ? plan_.step_degrees : -plan_.step_degrees;
    for (int angle = from; step > 0 ? angle <= to : angle >= to; angle += step)
    {
        if (!keep_running_()) {
            return false;
        }
        servo_.set_angle(port, angle);
        RCLCPP_DEBUG(logger_, "servo %d -> %d", port, angle);
        std::this_thread::sleep_for(plan_.step_delay);
    }
    return true;
}
