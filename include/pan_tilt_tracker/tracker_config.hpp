// include/pan_tilt_tracker/tracker_config.hpp
#ifndef TRACKER_CONFIG_HPP
#define TRACKER_CONFIG_HPP

#include <set>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief Checks a configuration before the loop starts.
 *
 * Rejects an empty class set, axis ranges with min above max or a center outside
 * the range, non-positive gains, deadzones outside [0, 1), a non-positive scan
 * step and negative minimum box sizes.
 *
 * @throws std::invalid_argument describing the first problem found.
 */
void validate_tracker_config(const TrackerConfig &config);

/**
 * @brief Resolves class names to detector class ids.
 *
 * Each requested entry is matched case-insensitively against the label table,
 * or taken as a numeric id if it parses as one. Entries that match nothing are
 * skipped with a warning on the given logger.
 *
 * @param requested Class names or ids requested by the operator.
 * @param class_labels Detector label table, indexed by class id.
 * @param logger Logger for skipped entries.
 * @return The resolved ids; empty if nothing matched.
 */
std::set<int> resolve_class_ids(
    const std::vector<std::string> &requested,
    const std::vector<std::string> &class_labels,
    const rclcpp::Logger &logger);

/**
 * @brief Returns the label of a class id, or "?" if the table has none.
 */
std::string class_label(int class_id, const std::vector<std::string> &class_labels);

#endif // TRACKER_CONFIG_HPP
