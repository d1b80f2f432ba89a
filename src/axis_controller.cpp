// src/axis_controller.cpp
#include "pan_tilt_tracker/axis_controller.hpp"

#include <algorithm>
#include <cmath>

AxisController::AxisController(const AxisConfig &config, ServoDriver &servo, int port)
    : config_(config), servo_(servo), port_(port)
{
}

double AxisController::clamp_angle(double angle, const AxisConfig &config)
{
    return std::max(static_cast<double>(config.min_angle),
                    std::min(static_cast<double>(config.max_angle), angle));
}

double AxisController::next_angle(double current_angle, const AxisConfig &config, double error)
{
    if (config.invert) {
        error = -error;
    }
    if (std::abs(error) < config.deadzone) {
        error = 0.0;
    }

    double half_range = (config.max_angle - config.min_angle) * 0.5;
    return clamp_angle(current_angle + config.gain * error * half_range, config);
}

AxisState AxisController::step(const AxisState &state, double error) const
{
    AxisState next;
    next.current_angle = next_angle(state.current_angle, config_, error);
    command(next.current_angle);
    return next;
}

int AxisController::to_command(double angle)
{
    return static_cast<int>(std::lround(angle));
}

int AxisController::command(double angle) const
{
    int rounded = to_command(angle);
    servo_.set_angle(port_, rounded);
    return rounded;
}
