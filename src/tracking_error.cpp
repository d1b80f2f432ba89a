// src/tracking_error.cpp
#include "pan_tilt_tracker/tracking_error.hpp"

#include <algorithm>

TrackingError compute_tracking_error(const SelectedTarget &target, double frame_width, double frame_height)
{
    double half_width = frame_width / 2.0;
    double half_height = frame_height / 2.0;

    TrackingError error;
    error.x = (target.center_x - half_width) / std::max(half_width, 1.0);
    error.y = (target.center_y - half_height) / std::max(half_height, 1.0);
    return error;
}
