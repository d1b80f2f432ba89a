// src/scan_controller.cpp
#include "pan_tilt_tracker/scan_controller.hpp"

#include <limits>

ScanController::ScanController(unsigned int miss_threshold, double step_degrees)
    : miss_threshold_(miss_threshold), step_degrees_(step_degrees)
{
}

ScanState ScanController::record_miss(const ScanState &scan) const
{
    ScanState next = scan;
    if (next.frames_since_target < std::numeric_limits<unsigned int>::max()) {
        ++next.frames_since_target;
    }
    return next;
}

bool ScanController::is_active(const ScanState &scan) const
{
    return scan.frames_since_target >= miss_threshold_;
}

ScanStep ScanController::tick(const ScanState &scan, const AxisState &pan, const AxisConfig &pan_config) const
{
    ScanStep next;
    next.scan = scan;
    next.pan.current_angle = pan.current_angle + scan.direction * step_degrees_;

    if (next.pan.current_angle >= pan_config.max_angle) {
        next.pan.current_angle = pan_config.max_angle;
        next.scan.direction = -1;
    } else if (next.pan.current_angle <= pan_config.min_angle) {
        next.pan.current_angle = pan_config.min_angle;
        next.scan.direction = 1;
    }

    return next;
}
