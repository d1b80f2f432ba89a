// include/pan_tilt_tracker/scan_controller.hpp
#ifndef SCAN_CONTROLLER_HPP
#define SCAN_CONTROLLER_HPP

#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief Result of one scan tick: the updated sweep state and pan angle.
 */
struct ScanStep {
    ScanState scan;
    AxisState pan;
};

/**
 * @class ScanController
 * @brief Sweeps the pan axis between its limits while no target is in view.
 *
 * Scanning only starts once frames_since_target has reached miss_threshold, so
 * that a single dropped detection does not move the camera.
 */
class ScanController
{
public:
    ScanController(unsigned int miss_threshold, double step_degrees);

    /// Counts one more frame without a target. The counter saturates instead of wrapping.
    ScanState record_miss(const ScanState &scan) const;

    /// True if the miss counter has reached the debounce threshold.
    bool is_active(const ScanState &scan) const;

    /**
     * @brief Advances the sweep by one step.
     *
     * On reaching a limit the angle is set exactly to that limit and the direction
     * reverses on the same tick.
     */
    ScanStep tick(const ScanState &scan, const AxisState &pan, const AxisConfig &pan_config) const;

    unsigned int miss_threshold() const { return miss_threshold_; }
    double step_degrees() const { return step_degrees_; }

private:
    unsigned int miss_threshold_;
    double step_degrees_;
};

#endif // SCAN_CONTROLLER_HPP
