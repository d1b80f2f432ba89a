// include/pan_tilt_tracker/tracking_types.hpp
#ifndef TRACKING_TYPES_HPP
#define TRACKING_TYPES_HPP

#include <cstdint>
#include <set>
#include <string>

/**
 * @brief Axis-aligned box in pixel coordinates, x1 < x2 and y1 < y2.
 */
struct BoundingBox {
    int x1;
    int y1;
    int x2;
    int y2;

    // Widened so that corners anywhere in the int range cannot overflow.
    std::int64_t width() const { return static_cast<std::int64_t>(x2) - x1; }
    std::int64_t height() const { return static_cast<std::int64_t>(y2) - y1; }

    /**
     * @brief Pixel area. Zero for empty or inverted boxes, saturated at INT64_MAX.
     */
    std::int64_t area() const;
};

/**
 * @brief One candidate object reported by the detector for the current frame.
 */
struct Detection {
    int class_id;
    BoundingBox bbox;
    double confidence;
};

/**
 * @brief Which detections may become the tracking target.
 */
struct TargetFilter {
    std::set<int> allowed_class_ids;
    int min_width = 0;
    int min_height = 0;
};

/**
 * @brief The detection chosen for this frame, reduced to what the controllers need.
 */
struct SelectedTarget {
    double center_x;
    double center_y;
    std::int64_t area;
    int class_id;
};

/**
 * @brief Static limits and tuning of one rotational axis, in degrees.
 */
struct AxisConfig {
    int center_angle = 90;
    int min_angle = 0;
    int max_angle = 180;
    double gain = 0.55;     ///< Fraction of the half-range moved per unit of normalized error.
    double deadzone = 0.05; ///< Errors below this magnitude are treated as zero.
    bool invert = false;
};

/**
 * @brief Continuous angle of one axis, kept unrounded across frames.
 */
struct AxisState {
    double current_angle;
};

/**
 * @brief Cross-frame state of the autonomous pan sweep.
 */
struct ScanState {
    unsigned int frames_since_target = 0;
    int direction = 1; ///< +1 sweeps toward max_angle, -1 toward min_angle.
};

/**
 * @brief What drives the axes on the current frame.
 */
enum class TrackingMode {
    TRACKING, ///< A target (or a brief dropout of one) drives both axes.
    SCANNING  ///< No target for miss_threshold frames; pan sweeps on its own.
};

/**
 * @brief Complete configuration of the control loop, fixed at startup.
 */
struct TrackerConfig {
    AxisConfig pan;
    AxisConfig tilt;
    int pan_port = 0;
    int tilt_port = 1;
    TargetFilter filter;
    unsigned int miss_threshold = 10;
    double scan_step_degrees = 2.0;
};

std::string to_string(TrackingMode mode);

#endif // TRACKING_TYPES_HPP
