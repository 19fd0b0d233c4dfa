#pragma once

#include "IDetector.hpp"
#include <mutex>
#include <vector>

namespace sorting_arm::vision {

/// A fixed set of detections reported for a number of consecutive frames
struct DetectionScene {
    int frames = 1;
    std::vector<Detection> detections;
};

/**
 * Replays scenes in order and loops. Used when no detection model is
 * attached (simulation and bench runs).
 */
class ScriptedDetector : public IDetector {
public:
    explicit ScriptedDetector(std::vector<DetectionScene> scenes);

    std::vector<Detection> detect(const Frame& frame) override;
    std::string name() const override { return "ScriptedDetector"; }

    size_t sceneIndex() const;

private:
    std::vector<DetectionScene> scenes_;
    size_t scene_ = 0;
    int framesInScene_ = 0;
    mutable std::mutex mutex_;
};

} // namespace sorting_arm::vision
