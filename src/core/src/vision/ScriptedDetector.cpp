#include "ScriptedDetector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace sorting_arm::vision {

ScriptedDetector::ScriptedDetector(std::vector<DetectionScene> scenes)
    : scenes_(std::move(scenes)) {
    spdlog::info("ScriptedDetector loaded {} scenes", scenes_.size());
}

std::vector<Detection> ScriptedDetector::detect(const Frame& /*frame*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scenes_.empty()) {
        return {};
    }

    // frames <= 0 counts as a single frame
    while (framesInScene_ >= std::max(scenes_[scene_].frames, 1)) {
        framesInScene_ = 0;
        scene_ = (scene_ + 1) % scenes_.size();
    }
    ++framesInScene_;
    return scenes_[scene_].detections;
}

size_t ScriptedDetector::sceneIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scene_;
}

} // namespace sorting_arm::vision
