// include/pan_tilt_tracker/tracking_error.hpp
#ifndef TRACKING_ERROR_HPP
#define TRACKING_ERROR_HPP

#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief Positional error of a target relative to the frame center.
 *
 * Both components are normalized by half the frame size, so a target on the
 * frame edge gives roughly +/-1. Positive x is right of center, positive y is below.
 */
struct TrackingError {
    double x;
    double y;
};

/**
 * @brief Computes the normalized error of the target's box center.
 * @param target The selected target.
 * @param frame_width Width of the frame in pixels.
 * @param frame_height Height of the frame in pixels.
 * @return The unclamped normalized error.
 */
TrackingError compute_tracking_error(const SelectedTarget &target, double frame_width, double frame_height);

#endif // TRACKING_ERROR_HPP
