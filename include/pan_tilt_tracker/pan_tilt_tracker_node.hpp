// include/pan_tilt_tracker/pan_tilt_tracker_node.hpp
#ifndef PAN_TILT_TRACKER_NODE_HPP
#define PAN_TILT_TRACKER_NODE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>
#include "geometry_msgs/msg/point.hpp"
#include "sensor_msgs/msg/joint_state.hpp"
#include "std_msgs/msg/string.hpp"
#include "vision_msgs/msg/detection2_d_array.hpp"

#include "pan_tilt_tracker/servo_driver.hpp"
#include "pan_tilt_tracker/tracking_loop.hpp"
#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @class PanTiltTrackerNode
 * @brief Keeps a pan-tilt camera pointed at the largest detection of the wanted classes.
 *
 * Every Detection2DArray received is treated as one frame and fed through the
 * TrackingLoop, which commands the servos. The node publishes the normalized
 * tracking error, the commanded joint angles and the current tracking mode.
 * The loop is destroyed with the node, which re-centers the head.
 */
class PanTiltTrackerNode : public rclcpp::Node
{
public:
    /**
     * @brief Constructor for the PanTiltTrackerNode.
     * @param options Configuration options for the ROS 2 node.
     * @throws std::invalid_argument on unusable parameters.
     * @throws std::runtime_error if the servo backend cannot be opened.
     */
    explicit PanTiltTrackerNode(const rclcpp::NodeOptions &options);

    /**
     * @brief Constructor that drives the given servo instead of the servo_backend one.
     * @param servo Driver to own; a null pointer selects the servo_backend parameter.
     */
    PanTiltTrackerNode(const rclcpp::NodeOptions &options, std::unique_ptr<ServoDriver> servo);

    /**
     * @brief Destructor. Re-centers the head before the servo driver is released.
     */
    ~PanTiltTrackerNode();

    /// True once a servo failure or the frame watchdog has stopped tracking.
    bool has_failed() const { return failed_; }

private:
    /**
     * @brief Runs one control iteration for a frame's detections.
     * @param msg All detections of the frame.
     */
    void detection_callback(const vision_msgs::msg::Detection2DArray::SharedPtr msg);

    /**
     * @brief Fails the run if detections stop arriving for longer than frame_timeout_ms.
     */
    void watchdog_callback();

    /**
     * @brief Creates the servo driver selected by the servo_backend parameter.
     */
    std::unique_ptr<ServoDriver> create_servo_driver(const std::string &backend);

    void publish_frame_result(const FrameResult &result);
    void update_fps();
    void log_status(const FrameResult &result, size_t num_detections);

    // --- ROS 2 Subscription ---
    rclcpp::Subscription<vision_msgs::msg::Detection2DArray>::SharedPtr detection_subscription_;

    // --- ROS 2 Publishers ---
    rclcpp::Publisher<geometry_msgs::msg::Point>::SharedPtr tracking_error_publisher_;
    rclcpp::Publisher<sensor_msgs::msg::JointState>::SharedPtr joint_state_publisher_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr tracking_mode_publisher_;

    rclcpp::TimerBase::SharedPtr watchdog_timer_;

    // --- Control ---
    std::unique_ptr<TrackingLoop> tracking_loop_;
    TrackingMode last_mode_;
    bool failed_;

    // --- Frame bookkeeping ---
    unsigned long frame_count_;
    unsigned int fps_frame_count_;
    double current_fps_;
    std::chrono::steady_clock::time_point last_fps_update_time_;
    std::chrono::steady_clock::time_point last_frame_time_;

    // --- Parameters ---
    int frame_width_;
    int frame_height_;
    int frame_timeout_ms_;
    std::vector<std::string> class_labels_;
    bool debug_;
};

#endif // PAN_TILT_TRACKER_NODE_HPP
