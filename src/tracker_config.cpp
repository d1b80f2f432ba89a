// src/tracker_config.cpp
#include "pan_tilt_tracker/tracker_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string &text)
{
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

bool parse_non_negative_int(const std::string &text, int &value)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = std::stoi(text);
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

void validate_axis(const std::string &name, const AxisConfig &axis)
{
    if (axis.min_angle > axis.max_angle) {
        throw std::invalid_argument(name + " axis: min_angle " + std::to_string(axis.min_angle) +
                                    " is greater than max_angle " + std::to_string(axis.max_angle) + ".");
    }
    if (axis.center_angle < axis.min_angle || axis.center_angle > axis.max_angle) {
        throw std::invalid_argument(name + " axis: center_angle " + std::to_string(axis.center_angle) +
                                    " is outside [" + std::to_string(axis.min_angle) + ", " +
                                    std::to_string(axis.max_angle) + "].");
    }
    if (!(axis.gain > 0.0)) {
        throw std::invalid_argument(name + " axis: gain must be positive.");
    }
    if (!(axis.deadzone >= 0.0 && axis.deadzone < 1.0)) {
        throw std::invalid_argument(name + " axis: deadzone must be in [0, 1).");
    }
}

} // namespace

void validate_tracker_config(const TrackerConfig &config)
{
    if (config.filter.allowed_class_ids.empty()) {
        throw std::invalid_argument("No classes to track: allowed class set is empty.");
    }
    if (config.filter.min_width < 0 || config.filter.min_height < 0) {
        throw std::invalid_argument("Minimum target width and height must not be negative.");
    }
    validate_axis("pan", config.pan);
    validate_axis("tilt", config.tilt);
    if (config.pan_port < 0 || config.tilt_port < 0) {
        throw std::invalid_argument("Servo ports must not be negative.");
    }
    if (config.pan_port == config.tilt_port) {
        throw std::invalid_argument("Pan and tilt must use different servo ports.");
    }
    if (!(config.scan_step_degrees > 0.0)) {
        throw std::invalid_argument("Scan step must be positive.");
    }
}

std::set<int> resolve_class_ids(
    const std::vector<std::string> &requested,
    const std::vector<std::string> &class_labels,
    const rclcpp::Logger &logger)
{
    std::set<int> ids;
    for (const auto &entry : requested)
    {
        std::string wanted = to_lower(trim(entry));
        if (wanted.empty()) {
            continue;
        }

        bool found = false;
        for (size_t i = 0; i < class_labels.size(); ++i) {
            if (to_lower(class_labels[i]) == wanted) {
                ids.insert(static_cast<int>(i));
                found = true;
                break;
            }
        }

        int numeric_id = 0;
        if (!found && parse_non_negative_int(wanted, numeric_id)) {
            ids.insert(numeric_id);
            found = true;
        }

        if (!found) {
            RCLCPP_WARN(logger, "Class '%s' is not known to the detector; skipping it.", entry.c_str());
        }
    }
    return ids;
}

std::string class_label(int class_id, const std::vector<std::string> &class_labels)
{
    if (class_id < 0 || static_cast<size_t>(class_id) >= class_labels.size()) {
        return "?";
    }
    return class_labels[class_id];
}
