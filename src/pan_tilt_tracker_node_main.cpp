// src/pan_tilt_tracker_node_main.cpp
#include "pan_tilt_tracker/pan_tilt_tracker_node.hpp"

#include <exception>
#include <memory>

// --- Main entrypoint ---
int main(int argc, char *argv[])
{
    rclcpp::init(argc, argv);
    rclcpp::NodeOptions options;
    int exit_code = 0;
    try {
        auto node = std::make_shared<PanTiltTrackerNode>(options);
        rclcpp::spin(node);
    } catch (const std::exception &e) {
        RCLCPP_ERROR(rclcpp::get_logger("main"), "Node error: %s", e.what());
        exit_code = 1;
    }
    rclcpp::shutdown();
    return exit_code;
}
