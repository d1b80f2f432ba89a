// include/pan_tilt_tracker/detection_conversion.hpp
#ifndef DETECTION_CONVERSION_HPP
#define DETECTION_CONVERSION_HPP

#include <optional>
#include <string>
#include <vector>

#include "vision_msgs/msg/detection2_d.hpp"
#include "vision_msgs/msg/detection2_d_array.hpp"

#include "pan_tilt_tracker/tracking_types.hpp"

/// Class id given to detections whose label is not in the label table.
const int UNKNOWN_CLASS_ID = -1;

/**
 * @brief Maps a hypothesis class id string to a numeric class id.
 *
 * Numeric strings are used as they are; anything else is looked up
 * case-insensitively in the label table.
 */
int parse_class_id(const std::string &class_id, const std::vector<std::string> &class_labels);

/**
 * @brief Converts one Detection2D (center and size) into a corner-form Detection.
 *
 * Corners are truncated to whole pixels. The first hypothesis supplies the class and
 * score; a detection without hypotheses gets UNKNOWN_CLASS_ID and zero confidence.
 *
 * @return std::nullopt if a corner is not finite or does not fit in an int.
 */
std::optional<Detection> from_ros_detection(const vision_msgs::msg::Detection2D &msg,
                             const std::vector<std::string> &class_labels);

/**
 * @brief Converts a whole Detection2DArray, keeping the message order.
 *
 * Detections that from_ros_detection() rejects are left out.
 */
std::vector<Detection> from_ros_detections(const vision_msgs::msg::Detection2DArray &msg,
                                           const std::vector<std::string> &class_labels);

#endif // DETECTION_CONVERSION_HPP
