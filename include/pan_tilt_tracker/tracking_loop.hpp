// include/pan_tilt_tracker/tracking_loop.hpp
#ifndef TRACKING_LOOP_HPP
#define TRACKING_LOOP_HPP

#include <memory>
#include <optional>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "pan_tilt_tracker/axis_controller.hpp"
#include "pan_tilt_tracker/scan_controller.hpp"
#include "pan_tilt_tracker/servo_driver.hpp"
#include "pan_tilt_tracker/tracking_error.hpp"
#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief What the loop did with one frame.
 */
struct FrameResult {
    TrackingMode mode;
    std::optional<SelectedTarget> target;
    TrackingError error;   ///< Zero when no target was selected.
    bool commanded;        ///< False while holding position during a short dropout.
    int pan_command;       ///< Last whole-degree angle sent to the pan servo.
    int tilt_command;      ///< Last whole-degree angle sent to the tilt servo.
};

/**
 * @class TrackingLoop
 * @brief Per-frame driver of the pan-tilt head.
 *
 * Owns the servo driver, both axis states and the scan state. Each call to
 * process_frame() runs target selection and then either the two axis controllers
 * or, after miss_threshold target-free frames, the scan controller. The servos are
 * centered by start() and again by shutdown(); the destructor calls shutdown() so
 * the head is re-centered on every exit path before the driver is released.
 */
class TrackingLoop
{
public:
    /**
     * @brief Validates the configuration and takes ownership of the servo driver.
     * @throws std::invalid_argument if the configuration makes tracking impossible.
     */
    TrackingLoop(const TrackerConfig &config, std::unique_ptr<ServoDriver> servo,
                 rclcpp::Logger logger = rclcpp::get_logger("tracking_loop"));

    /**
     * @brief Re-centers both axes if shutdown() has not run yet. Never throws.
     */
    ~TrackingLoop();

    TrackingLoop(const TrackingLoop &) = delete;
    TrackingLoop &operator=(const TrackingLoop &) = delete;

    /**
     * @brief Commands both axes to their center angle. Must precede the first frame.
     */
    void start();

    /**
     * @brief Runs one control iteration.
     * @param detections All detections of the frame.
     * @param frame_width Frame width in pixels.
     * @param frame_height Frame height in pixels.
     * @throws std::runtime_error (or any driver exception) if a servo command fails.
     */
    FrameResult process_frame(const std::vector<Detection> &detections,
                              double frame_width, double frame_height);

    /**
     * @brief Re-centers both axes. Runs once; later calls do nothing.
     */
    void shutdown();

    TrackingMode mode() const { return mode_; }
    const AxisState &pan_state() const { return pan_state_; }
    const AxisState &tilt_state() const { return tilt_state_; }
    const ScanState &scan_state() const { return scan_state_; }
    const TrackerConfig &config() const { return config_; }
    bool is_started() const { return started_; }

private:
    void center_axes();

    TrackerConfig config_;
    std::unique_ptr<ServoDriver> servo_;
    rclcpp::Logger logger_;

    AxisController pan_controller_;
    AxisController tilt_controller_;
    ScanController scan_controller_;

    AxisState pan_state_;
    AxisState tilt_state_;
    ScanState scan_state_;
    TrackingMode mode_;

    int pan_command_;
    int tilt_command_;
    unsigned long frame_count_;
    bool started_;
    bool shut_down_;
};

#endif // TRACKING_LOOP_HPP
