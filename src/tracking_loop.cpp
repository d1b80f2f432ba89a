// src/tracking_loop.cpp
#include "pan_tilt_tracker/tracking_loop.hpp"
#include "pan_tilt_tracker/constants.hpp"
#include "pan_tilt_tracker/target_selector.hpp"
#include "pan_tilt_tracker/tracker_config.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace {

// Runs before any member that depends on the configuration is built.
const TrackerConfig &checked(const TrackerConfig &config)
{
    validate_tracker_config(config);
    return config;
}

ServoDriver &checked(const std::unique_ptr<ServoDriver> &servo)
{
    if (!servo) {
        throw std::invalid_argument("TrackingLoop requires a servo driver.");
    }
    return *servo;
}

} // namespace

// --- Constructor / Destructor ---

TrackingLoop::TrackingLoop(const TrackerConfig &config, std::unique_ptr<ServoDriver> servo, rclcpp::Logger logger)
    : config_(checked(config)),
      servo_(std::move(servo)),
      logger_(logger),
      pan_controller_(config_.pan, checked(servo_), config_.pan_port),
      tilt_controller_(config_.tilt, *servo_, config_.tilt_port),
      scan_controller_(config_.miss_threshold, config_.scan_step_degrees),
      pan_state_{static_cast<double>(config_.pan.center_angle)},
      tilt_state_{static_cast<double>(config_.tilt.center_angle)},
      scan_state_(),
      mode_(TrackingMode::TRACKING),
      pan_command_(config_.pan.center_angle),
      tilt_command_(config_.tilt.center_angle),
      frame_count_(0),
      started_(false),
      shut_down_(false)
{
}

TrackingLoop::~TrackingLoop()
{
    try {
        shutdown();
    } catch (const std::exception &e) {
        RCLCPP_ERROR(logger_, "Failed to re-center pan-tilt head on shutdown: %s", e.what());
    }
}

// --- Lifecycle ---

void TrackingLoop::start()
{
    center_axes();
    started_ = true;
    RCLCPP_INFO(logger_, "Pan-tilt head centered (pan=%d, tilt=%d).", pan_command_, tilt_command_);
}

void TrackingLoop::shutdown()
{
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    RCLCPP_INFO(logger_, "Centering pan-tilt head before shutdown...");
    center_axes();
}

void TrackingLoop::center_axes()
{
    pan_state_.current_angle = config_.pan.center_angle;
    tilt_state_.current_angle = config_.tilt.center_angle;

    // Attempt both axes even if the first one fails.
    std::exception_ptr failure;
    try {
        pan_command_ = pan_controller_.command(pan_state_.current_angle);
    } catch (...) {
        failure = std::current_exception();
    }
    try {
        tilt_command_ = tilt_controller_.command(tilt_state_.current_angle);
    } catch (...) {
        if (!failure) {
            failure = std::current_exception();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

// --- Per-frame control ---

FrameResult TrackingLoop::process_frame(const std::vector<Detection> &detections,
                                        double frame_width, double frame_height)
{
    if (!started_) {
        throw std::logic_error("TrackingLoop::process_frame called before start().");
    }
    ++frame_count_;

    FrameResult result;
    result.target = select_target(detections, config_.filter);
    result.error = TrackingError{0.0, 0.0};
    result.commanded = false;

    if (result.target)
    {
        if (mode_ == TrackingMode::SCANNING) {
            RCLCPP_INFO(logger_, "Target acquired (class %d) after %u frames without one.",
                        result.target->class_id, scan_state_.frames_since_target);
        }
        mode_ = TrackingMode::TRACKING;
        scan_state_.frames_since_target = 0;

        result.error = compute_tracking_error(*result.target, frame_width, frame_height);
        pan_state_ = pan_controller_.step(pan_state_, result.error.x);
        tilt_state_ = tilt_controller_.step(tilt_state_, result.error.y);
        pan_command_ = AxisController::to_command(pan_state_.current_angle);
        tilt_command_ = AxisController::to_command(tilt_state_.current_angle);
        result.commanded = true;
    }
    else
    {
        scan_state_ = scan_controller_.record_miss(scan_state_);

        if (scan_controller_.is_active(scan_state_))
        {
            if (mode_ != TrackingMode::SCANNING) {
                RCLCPP_INFO(logger_, "Target lost - entering scan mode");
            }
            mode_ = TrackingMode::SCANNING;

            ScanStep next = scan_controller_.tick(scan_state_, pan_state_, config_.pan);
            scan_state_ = next.scan;
            pan_state_ = next.pan;
            pan_command_ = pan_controller_.command(pan_state_.current_angle);
            tilt_command_ = tilt_controller_.command(tilt_state_.current_angle);
            result.commanded = true;

            if (frame_count_ % SCAN_LOG_INTERVAL_FRAMES == 0) {
                RCLCPP_INFO(logger_, "Scan: pan=%d", pan_command_);
            }
        }
    }

    result.mode = mode_;
    result.pan_command = pan_command_;
    result.tilt_command = tilt_command_;
    return result;
}
