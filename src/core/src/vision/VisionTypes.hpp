/**
 * @file VisionTypes.hpp
 * @brief Frames and detections exchanged with the camera and detector
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sorting_arm {
namespace vision {

/**
 * Axis-aligned box in image pixels
 */
struct BoundingBox {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    double centerX() const { return (x1 + x2) / 2.0; }
    double centerY() const { return (y1 + y2) / 2.0; }
    double width() const { return x2 - x1; }
    double height() const { return y2 - y1; }
};

struct Detection {
    std::string class_name;
    double confidence = 0.0;
    BoundingBox bbox;
};

/**
 * One camera image. Pixel data is optional: simulated sources and
 * detectors that only need the frame identity leave it empty.
 */
struct Frame {
    uint64_t sequence = 0;
    int width = 0;
    int height = 0;
    int channels = 3;
    std::chrono::steady_clock::time_point timestamp;
    std::vector<uint8_t> data;

    bool isValid() const { return width > 0 && height > 0; }
};

} // namespace vision
} // namespace sorting_arm
