// src/target_selector.cpp
#include "pan_tilt_tracker/target_selector.hpp"

#include <cstdint>

bool is_trackable(const Detection &detection, const TargetFilter &filter)
{
    if (filter.allowed_class_ids.count(detection.class_id) == 0) {
        return false;
    }
    return detection.bbox.width() >= filter.min_width &&
           detection.bbox.height() >= filter.min_height;
}

std::optional<SelectedTarget> select_target(
    const std::vector<Detection> &detections,
    const TargetFilter &filter)
{
    std::optional<SelectedTarget> best;

    for (const auto &detection : detections)
    {
        if (!is_trackable(detection, filter)) {
            continue;
        }

        // Strictly greater: an equal-area detection later in the list does not replace the first.
        std::int64_t area = detection.bbox.area();
        if (area <= 0 || (best && area <= best->area)) {
            continue;
        }

        SelectedTarget target;
        target.center_x = (static_cast<double>(detection.bbox.x1) + detection.bbox.x2) / 2.0;
        target.center_y = (static_cast<double>(detection.bbox.y1) + detection.bbox.y2) / 2.0;
        target.area = area;
        target.class_id = detection.class_id;
        best = target;
    }

    return best;
}
