// src/tracking_types.cpp
#include "pan_tilt_tracker/tracking_types.hpp"

#include <limits>

std::int64_t BoundingBox::area() const
{
    if (width() <= 0 || height() <= 0) {
        return 0;
    }
    // Both sides are below 2^32, so the unsigned product cannot wrap.
    const std::uint64_t product = static_cast<std::uint64_t>(width()) * static_cast<std::uint64_t>(height());
    const auto max_area = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    return product > max_area ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(product);
}

std::string to_string(TrackingMode mode)
{
    switch (mode) {
        case TrackingMode::TRACKING: return "tracking";
        case TrackingMode::SCANNING: return "scanning";
    }
    return "unknown";
}
