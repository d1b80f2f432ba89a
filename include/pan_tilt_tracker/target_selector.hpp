// include/pan_tilt_tracker/target_selector.hpp
#ifndef TARGET_SELECTOR_HPP
#define TARGET_SELECTOR_HPP

#include <optional>
#include <vector>

#include "pan_tilt_tracker/tracking_types.hpp"

/**
 * @brief Returns true if the detection passes the class and minimum size filter.
 */
bool is_trackable(const Detection &detection, const TargetFilter &filter);

/**
 * @brief Picks the tracking target for this frame.
 *
 * Among detections that pass the filter, the one with the largest pixel area wins.
 * A later detection replaces the current best only if its area is strictly greater,
 * so ties keep the earliest detection in list order. Boxes with no area are never
 * selected.
 *
 * @param detections Detections of the current frame, in detector order.
 * @param filter Allowed classes and minimum box size.
 * @return The selected target, or std::nullopt if no detection qualifies.
 */
std::optional<SelectedTarget> select_target(
    const std::vector<Detection> &detections,
    const TargetFilter &filter);

#endif // TARGET_SELECTOR_HPP
