// src/servo_sweep_main.cpp
#include "pan_tilt_tracker/servo_sweep.hpp"
#include "pan_tilt_tracker/mock_servo_driver.hpp"
#include "pan_tilt_tracker/pca9685_servo_driver.hpp"

#include <memory>
#include <string>

// --- Main entrypoint ---
int main(int argc, char *argv[])
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<rclcpp::Node>("servo_sweep");
    auto logger = node->get_logger();

    node->declare_parameter<bool>("sweep_once", false);
    node->declare_parameter<bool>("use_mock", false);
    node->declare_parameter<int>("sweep_step_degrees", 5);
    node->declare_parameter<int>("sweep_delay_ms", 50);
    node->declare_parameter<int>("pan_port", 0);
    node->declare_parameter<int>("pan_center", 90);
    node->declare_parameter<int>("pan_min", 30);
    node->declare_parameter<int>("pan_max", 150);
    node->declare_parameter<int>("tilt_port", 1);
    node->declare_parameter<int>("tilt_center", 90);
    node->declare_parameter<int>("tilt_min", 50);
    node->declare_parameter<int>("tilt_max", 130);
    node->declare_parameter<std::string>("i2c_device", "/dev/i2c-1");
    node->declare_parameter<int>("i2c_address", 0x40);

    SweepPlan plan;
    plan.pan_port = node->get_parameter("pan_port").as_int();
    plan.pan.center_angle = node->get_parameter("pan_center").as_int();
    plan.pan.min_angle = node->get_parameter("pan_min").as_int();
    plan.pan.max_angle = node->get_parameter("pan_max").as_int();
    plan.tilt_port = node->get_parameter("tilt_port").as_int();
    plan.tilt.center_angle = node->get_parameter("tilt_center").as_int();
    plan.tilt.min_angle = node->get_parameter("tilt_min").as_int();
    plan.tilt.max_angle = node->get_parameter("tilt_max").as_int();
    plan.step_degrees = node->get_parameter("sweep_step_degrees").as_int();
    plan.step_delay = std::chrono::milliseconds(node->get_parameter("sweep_delay_ms").as_int());
    bool sweep_once = node->get_parameter("sweep_once").as_bool();
    bool use_mock = node->get_parameter("use_mock").as_bool();

    int exit_code = 0;
    try {
        std::unique_ptr<ServoDriver> servo;
        if (use_mock) {
            RCLCPP_INFO(logger, "Mock mode: no hardware.");
            servo = std::make_unique<MockServoDriver>();
        } else {
            Pca9685Options options;
            options.i2c_device = node->get_parameter("i2c_device").as_string();
            options.i2c_address = node->get_parameter("i2c_address").as_int();
            servo = std::make_unique<Pca9685ServoDriver>(options);
            RCLCPP_INFO(logger, "Using PCA9685 over I2C. Press Ctrl+C to stop.");
        }
        RCLCPP_INFO(logger, "Servo test (pan port %d, tilt port %d)", plan.pan_port, plan.tilt_port);

        ServoSweep sweep(*servo, plan, []() { return rclcpp::ok(); }, logger);
        while (rclcpp::ok()) {
            if (!sweep.run_once() || sweep_once) {
                break;
            }
        }
        sweep.center();
        RCLCPP_INFO(logger, "%s Centered.", rclcpp::ok() ? "Done." : "Stopped.");
    } catch (const std::exception &e) {
        RCLCPP_ERROR(logger, "Servo sweep failed: %s", e.what());
        exit_code = 1;
    }

    rclcpp::shutdown();
    return exit_code;
}
