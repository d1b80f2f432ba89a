// include/pan_tilt_tracker/constants.hpp
#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <string>
#include <vector>

// Hardware-safe absolute range of a hobby servo, independent of any per-axis limits.
const int SERVO_ABSOLUTE_MIN_ANGLE = 0;
const int SERVO_ABSOLUTE_MAX_ANGLE = 180;

// Angle reported for a joint that has never been commanded.
const int SERVO_DEFAULT_ANGLE = 90;

// Ports a driver exposes when no channel count is configured (Arducam pan-tilt: 0=pan, 1=tilt).
const int DEFAULT_SERVO_PORTS = 4;

// Frame counts between periodic log lines.
const unsigned int DEBUG_LOG_INTERVAL_FRAMES = 20;
const unsigned int SCAN_LOG_INTERVAL_FRAMES = 15;

// Headless status line period.
const int STATUS_LOG_PERIOD_MS = 2000;

// Class label table of the COCO-trained detector, indexed by class id.
inline std::vector<std::string> default_class_labels()
{
    return {
        "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck", "boat",
        "traffic light", "fire hydrant", "stop sign", "parking meter", "bench", "bird", "cat",
        "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe", "backpack",
        "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard", "sports ball",
        "kite", "baseball bat", "baseball glove", "skateboard", "surfboard", "tennis racket",
        "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl", "banana", "apple",
        "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
        "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop", "mouse",
        "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
        "refrigerator", "book", "clock", "vase", "scissors", "teddy bear", "hair drier",
        "toothbrush"};
}

#endif // CONSTANTS_HPP
