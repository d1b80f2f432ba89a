// src/detection_conversion.cpp
#include "pan_tilt_tracker/detection_conversion.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <iterator>

int parse_class_id(const std::string &class_id, const std::vector<std::string> &class_labels)
{
    if (!class_id.empty() &&
        std::all_of(class_id.begin(), class_id.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        try {
            return std::stoi(class_id);
        } catch (const std::out_of_range &) {
            return UNKNOWN_CLASS_ID;
        }
    }

    auto equals_ignore_case = [&class_id](const std::string &label) {
        return label.size() == class_id.size() &&
               std::equal(label.begin(), label.end(), class_id.begin(),
                          [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    };
    auto it = std::find_if(class_labels.begin(), class_labels.end(), equals_ignore_case);
    if (it == class_labels.end()) {
        return UNKNOWN_CLASS_ID;
    }
    return static_cast<int>(std::distance(class_labels.begin(), it));
}

namespace {

// True if truncating the value to int is well defined.
bool fits_in_int(double value)
{
    return std::isfinite(value) &&
           value > static_cast<double>(std::numeric_limits<int>::min()) - 1.0 &&
           value < static_cast<double>(std::numeric_limits<int>::max()) + 1.0;
}

} // namespace

std::optional<Detection> from_ros_detection(const vision_msgs::msg::Detection2D &msg,
                                            const std::vector<std::string> &class_labels)
{
    const double center_x = msg.bbox.center.position.x;
    const double center_y = msg.bbox.center.position.y;
    const double x1 = center_x - msg.bbox.size_x / 2.0;
    const double y1 = center_y - msg.bbox.size_y / 2.0;
    const double x2 = center_x + msg.bbox.size_x / 2.0;
    const double y2 = center_y + msg.bbox.size_y / 2.0;

    if (!fits_in_int(x1) || !fits_in_int(y1) || !fits_in_int(x2) || !fits_in_int(y2)) {
        return std::nullopt;
    }

    Detection detection;
    detection.bbox.x1 = static_cast<int>(x1);
    detection.bbox.y1 = static_cast<int>(y1);
    detection.bbox.x2 = static_cast<int>(x2);
    detection.bbox.y2 = static_cast<int>(y2);

    if (msg.results.empty()) {
        detection.class_id = UNKNOWN_CLASS_ID;
        detection.confidence = 0.0;
    } else {
        const auto &hypothesis = msg.results.front().hypothesis;
        detection.class_id = parse_class_id(hypothesis.class_id, class_labels);
        detection.confidence = hypothesis.score;
    }
    return detection;
}

std::vector<Detection> from_ros_detections(const vision_msgs::msg::Detection2DArray &msg,
                                           const std::vector<std::string> &class_labels)
{
    std::vector<Detection> detections;
    detections.reserve(msg.detections.size());
    for (const auto &detection : msg.detections) {
        if (auto converted = from_ros_detection(detection, class_labels)) {
            detections.push_back(*converted);
        }
    }
    return detections;
}
