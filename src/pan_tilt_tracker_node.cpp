// src/pan_tilt_tracker_node.cpp
#include "pan_tilt_tracker/pan_tilt_tracker_node.hpp"
#include "pan_tilt_tracker/constants.hpp"
#include "pan_tilt_tracker/detection_conversion.hpp"
#include "pan_tilt_tracker/mock_servo_driver.hpp"
#include "pan_tilt_tracker/pca9685_servo_driver.hpp"
#include "pan_tilt_tracker/tracker_config.hpp"

#include <cmath> // For M_PI
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// --- Constructor ---
PanTiltTrackerNode::PanTiltTrackerNode(const rclcpp::NodeOptions &options)
    : PanTiltTrackerNode(options, nullptr)
{
}

PanTiltTrackerNode::PanTiltTrackerNode(const rclcpp::NodeOptions &options, std::unique_ptr<ServoDriver> servo)
    : Node("pan_tilt_tracker_node", options),
      last_mode_(TrackingMode::TRACKING), failed_(false),
      frame_count_(0), fps_frame_count_(0), current_fps_(0.0),
      last_fps_update_time_(std::chrono::steady_clock::now()),
      last_frame_time_(std::chrono::steady_clock::now())
{
    RCLCPP_INFO(this->get_logger(), "Initializing PanTiltTrackerNode...");

    // --- Parameters ---
    this->declare_parameter<std::string>("detection_topic", "/detections");
    this->declare_parameter<std::string>("tracking_error_topic", "/tracking_error");
    this->declare_parameter<std::string>("joint_state_topic", "/pan_tilt/joint_states");
    this->declare_parameter<std::string>("tracking_mode_topic", "/pan_tilt/tracking_mode");
    this->declare_parameter<int>("qos_history_depth", 10);
    this->declare_parameter<int>("frame_width", 640);
    this->declare_parameter<int>("frame_height", 480);
    this->declare_parameter<int>("frame_timeout_ms", 0); // 0 disables the watchdog

    this->declare_parameter<std::vector<std::string>>("allowed_classes", std::vector<std::string>{"cat", "person"});
    this->declare_parameter<std::vector<std::string>>("class_labels", default_class_labels());
    this->declare_parameter<int>("min_width", 0);
    this->declare_parameter<int>("min_height", 0);

    this->declare_parameter<int>("pan_port", 0);
    this->declare_parameter<int>("pan_center", 90);
    this->declare_parameter<int>("pan_min", 30);
    this->declare_parameter<int>("pan_max", 150);
    this->declare_parameter<double>("pan_gain", 0.55);
    this->declare_parameter<double>("pan_deadzone", 0.05);
    this->declare_parameter<bool>("invert_pan", false);

    this->declare_parameter<int>("tilt_port", 1);
    this->declare_parameter<int>("tilt_center", 90);
    this->declare_parameter<int>("tilt_min", 50);
    this->declare_parameter<int>("tilt_max", 130);
    this->declare_parameter<double>("tilt_gain", 0.55);
    this->declare_parameter<double>("tilt_deadzone", 0.05);
    this->declare_parameter<bool>("invert_tilt", false);

    this->declare_parameter<int>("miss_threshold", 10);
    this->declare_parameter<double>("scan_step_degrees", 2.0);

    this->declare_parameter<std::string>("servo_backend", "auto"); // auto, pca9685 or mock
    this->declare_parameter<std::string>("i2c_device", "/dev/i2c-1");
    this->declare_parameter<int>("i2c_address", 0x40);
    this->declare_parameter<int>("servo_channels", 16);
    this->declare_parameter<int>("servo_min_pulse_us", 750);
    this->declare_parameter<int>("servo_max_pulse_us", 2250);

    this->declare_parameter<bool>("debug", false);

    auto detection_topic = this->get_parameter("detection_topic").as_string();
    auto tracking_error_topic = this->get_parameter("tracking_error_topic").as_string();
    auto joint_state_topic = this->get_parameter("joint_state_topic").as_string();
    auto tracking_mode_topic = this->get_parameter("tracking_mode_topic").as_string();
    int qos_history_depth = this->get_parameter("qos_history_depth").as_int();
    frame_width_ = this->get_parameter("frame_width").as_int();
    frame_height_ = this->get_parameter("frame_height").as_int();
    frame_timeout_ms_ = this->get_parameter("frame_timeout_ms").as_int();
    class_labels_ = this->get_parameter("class_labels").as_string_array();
    debug_ = this->get_parameter("debug").as_bool();

    if (frame_width_ <= 0 || frame_height_ <= 0) {
        RCLCPP_FATAL(this->get_logger(), "Invalid frame size %dx%d.", frame_width_, frame_height_);
        throw std::invalid_argument("Parameters 'frame_width' and 'frame_height' must be positive.");
    }

    TrackerConfig config;
    auto allowed_classes = this->get_parameter("allowed_classes").as_string_array();
    config.filter.allowed_class_ids = resolve_class_ids(allowed_classes, class_labels_, this->get_logger());
    config.filter.min_width = this->get_parameter("min_width").as_int();
    config.filter.min_height = this->get_parameter("min_height").as_int();

    config.pan_port = this->get_parameter("pan_port").as_int();
    config.pan.center_angle = this->get_parameter("pan_center").as_int();
    config.pan.min_angle = this->get_parameter("pan_min").as_int();
    config.pan.max_angle = this->get_parameter("pan_max").as_int();
    config.pan.gain = this->get_parameter("pan_gain").as_double();
    config.pan.deadzone = this->get_parameter("pan_deadzone").as_double();
    config.pan.invert = this->get_parameter("invert_pan").as_bool();

    config.tilt_port = this->get_parameter("tilt_port").as_int();
    config.tilt.center_angle = this->get_parameter("tilt_center").as_int();
    config.tilt.min_angle = this->get_parameter("tilt_min").as_int();
    config.tilt.max_angle = this->get_parameter("tilt_max").as_int();
    config.tilt.gain = this->get_parameter("tilt_gain").as_double();
    config.tilt.deadzone = this->get_parameter("tilt_deadzone").as_double();
    config.tilt.invert = this->get_parameter("invert_tilt").as_bool();

    int miss_threshold = this->get_parameter("miss_threshold").as_int();
    if (miss_threshold < 0) {
        RCLCPP_FATAL(this->get_logger(), "Parameter 'miss_threshold' is negative (%d).", miss_threshold);
        throw std::invalid_argument("Parameter 'miss_threshold' must not be negative.");
    }
    config.miss_threshold = static_cast<unsigned int>(miss_threshold);
    config.scan_step_degrees = this->get_parameter("scan_step_degrees").as_double();

    try {
        validate_tracker_config(config);
    } catch (const std::invalid_argument &e) {
        RCLCPP_FATAL(this->get_logger(), "Invalid tracker configuration: %s", e.what());
        throw;
    }

    std::ostringstream tracked;
    for (int id : config.filter.allowed_class_ids) {
        tracked << (tracked.tellp() > 0 ? ", " : "") << class_label(id, class_labels_) << " (id " << id << ")";
    }

    if (!servo) {
        servo = create_servo_driver(this->get_parameter("servo_backend").as_string());
    } else {
        RCLCPP_INFO(this->get_logger(), "  Servo: caller-provided driver");
    }
    tracking_loop_ = std::make_unique<TrackingLoop>(
        config, std::move(servo), this->get_logger().get_child("tracking_loop"));

    RCLCPP_INFO(this->get_logger(), "  Tracking class IDs: %s", tracked.str().c_str());
    RCLCPP_INFO(this->get_logger(), "  Frame Size: %dx%d", frame_width_, frame_height_);
    RCLCPP_INFO(this->get_logger(), "  Pan: port %d, range [%d, %d], center %d, gain %.2f, deadzone %.2f%s",
                config.pan_port, config.pan.min_angle, config.pan.max_angle, config.pan.center_angle,
                config.pan.gain, config.pan.deadzone, config.pan.invert ? ", inverted" : "");
    RCLCPP_INFO(this->get_logger(), "  Tilt: port %d, range [%d, %d], center %d, gain %.2f, deadzone %.2f%s",
                config.tilt_port, config.tilt.min_angle, config.tilt.max_angle, config.tilt.center_angle,
                config.tilt.gain, config.tilt.deadzone, config.tilt.invert ? ", inverted" : "");
    RCLCPP_INFO(this->get_logger(), "  Scan: after %u frames, %.1f deg per frame",
                config.miss_threshold, config.scan_step_degrees);

    // --- QoS Profile ---
    rclcpp::QoS qos_profile(rclcpp::KeepLast(qos_history_depth));
    qos_profile.reliable();

    // --- Publishers ---
    tracking_error_publisher_ = this->create_publisher<geometry_msgs::msg::Point>(tracking_error_topic, qos_profile);
    joint_state_publisher_ = this->create_publisher<sensor_msgs::msg::JointState>(joint_state_topic, qos_profile);
    tracking_mode_publisher_ = this->create_publisher<std_msgs::msg::String>(tracking_mode_topic, qos_profile);

    // Center before the first frame can arrive.
    tracking_loop_->start();

    // --- Subscription ---
    detection_subscription_ = this->create_subscription<vision_msgs::msg::Detection2DArray>(
        detection_topic, qos_profile,
        std::bind(&PanTiltTrackerNode::detection_callback, this, std::placeholders::_1));

    if (frame_timeout_ms_ > 0) {
        watchdog_timer_ = this->create_wall_timer(
            std::chrono::milliseconds(frame_timeout_ms_),
            std::bind(&PanTiltTrackerNode::watchdog_callback, this));
    }

    RCLCPP_INFO(this->get_logger(), "PanTiltTrackerNode fully initialized. Listening on %s.", detection_topic.c_str());
}

PanTiltTrackerNode::~PanTiltTrackerNode()
{
    RCLCPP_INFO(this->get_logger(), "Shutting down PanTiltTrackerNode...");
    // Destroying the loop re-centers the head and then releases the servo driver.
    tracking_loop_.reset();
    RCLCPP_INFO(this->get_logger(), "PanTiltTrackerNode shut down complete.");
}

std::unique_ptr<ServoDriver> PanTiltTrackerNode::create_servo_driver(const std::string &backend)
{
    int channels = this->get_parameter("servo_channels").as_int();

    if (backend == "mock") {
        RCLCPP_INFO(this->get_logger(), "  Servo: mock (%d ports)", channels);
        return std::make_unique<MockServoDriver>(channels);
    }
    if (backend != "pca9685" && backend != "auto") {
        RCLCPP_FATAL(this->get_logger(), "Unknown servo_backend '%s'.", backend.c_str());
        throw std::invalid_argument("Parameter 'servo_backend' must be 'auto', 'pca9685' or 'mock'.");
    }

    Pca9685Options pca_options;
    pca_options.i2c_device = this->get_parameter("i2c_device").as_string();
    pca_options.i2c_address = this->get_parameter("i2c_address").as_int();
    pca_options.channels = channels;
    pca_options.min_pulse_us = this->get_parameter("servo_min_pulse_us").as_int();
    pca_options.max_pulse_us = this->get_parameter("servo_max_pulse_us").as_int();

    try {
        auto driver = std::make_unique<Pca9685ServoDriver>(pca_options);
        RCLCPP_INFO(this->get_logger(), "  Servo: PCA9685 on %s at 0x%02x",
                    pca_options.i2c_device.c_str(), pca_options.i2c_address);
        return driver;
    } catch (const std::runtime_error &e) {
        if (backend == "pca9685") {
            RCLCPP_FATAL(this->get_logger(), "Failed to open PCA9685: %s", e.what());
            throw;
        }
        RCLCPP_WARN(this->get_logger(), "Servo hardware disabled - %s. Falling back to mock servos.", e.what());
        return std::make_unique<MockServoDriver>(channels);
    }
}

// --- Callbacks ---

void PanTiltTrackerNode::detection_callback(const vision_msgs::msg::Detection2DArray::SharedPtr msg)
{
    if (failed_) {
        return;
    }
    last_frame_time_ = std::chrono::steady_clock::now();
    ++frame_count_;

    std::vector<Detection> detections = from_ros_detections(*msg, class_labels_);
    if (detections.size() != msg->detections.size()) {
        RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), STATUS_LOG_PERIOD_MS,
                             "Dropped %zu detection(s) with non-finite or out-of-range boxes.",
                             msg->detections.size() - detections.size());
    }

    FrameResult result;
    try {
        result = tracking_loop_->process_frame(detections, frame_width_, frame_height_);
    } catch (const std::exception &e) {
        RCLCPP_FATAL(this->get_logger(), "Servo command failed on frame %lu: %s", frame_count_, e.what());
        failed_ = true;
        throw;
    }

    if (result.mode != last_mode_) {
        auto mode_msg = std_msgs::msg::String();
        mode_msg.data = to_string(result.mode);
        tracking_mode_publisher_->publish(mode_msg);
        last_mode_ = result.mode;
    }

    publish_frame_result(result);
    update_fps();
    log_status(result, detections.size());
}

void PanTiltTrackerNode::watchdog_callback()
{
    if (failed_ || frame_count_ == 0) {
        return;
    }
    auto silence = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - last_frame_time_);
    if (silence.count() > frame_timeout_ms_) {
        RCLCPP_ERROR(this->get_logger(), "No detections for %ld ms. Stopping the tracker.",
                     static_cast<long>(silence.count()));
        failed_ = true;
        tracking_loop_->shutdown();
        rclcpp::shutdown();
    }
}

// --- Helpers ---

void PanTiltTrackerNode::publish_frame_result(const FrameResult &result)
{
    auto error_msg = geometry_msgs::msg::Point();
    error_msg.x = result.error.x;
    error_msg.y = result.error.y;
    error_msg.z = 0.0; // z is unused
    tracking_error_publisher_->publish(error_msg);

    auto joint_msg = sensor_msgs::msg::JointState();
    joint_msg.header.stamp = this->get_clock()->now();
    joint_msg.name = {"pan_joint", "tilt_joint"};
    joint_msg.position = {result.pan_command * M_PI / 180.0, result.tilt_command * M_PI / 180.0};
    joint_state_publisher_->publish(joint_msg);
}

void PanTiltTrackerNode::update_fps()
{
    ++fps_frame_count_;
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - last_fps_update_time_).count();
    if (elapsed >= 1.0) {
        current_fps_ = fps_frame_count_ / elapsed;
        fps_frame_count_ = 0;
        last_fps_update_time_ = now;
    }
}

void PanTiltTrackerNode::log_status(const FrameResult &result, size_t num_detections)
{
    std::string target = result.target ? class_label(result.target->class_id, class_labels_) : "none";

    if (debug_ && frame_count_ % DEBUG_LOG_INTERVAL_FRAMES == 0) {
        RCLCPP_INFO(this->get_logger(), "DEBUG: detections=%zu target=%s pan=%d tilt=%d",
                    num_detections, target.c_str(), result.pan_command, result.tilt_command);
    }

    RCLCPP_INFO_THROTTLE(this->get_logger(), *this->get_clock(), STATUS_LOG_PERIOD_MS,
                         "FPS: %.0f | Target: %s | pan=%d tilt=%d",
                         current_fps_, result.target ? target.c_str() : "scanning",
                         result.pan_command, result.tilt_command);
}
