#pragma once

#include "VisionTypes.hpp"
#include <string>
#include <vector>

namespace sorting_arm::vision {

/// Object detector boundary: one frame in, zero or more detections out
class IDetector {
public:
    virtual ~IDetector() = default;

    virtual std::vector<Detection> detect(const Frame& frame) = 0;
    virtual std::string name() const = 0;
};

} // namespace sorting_arm::vision
