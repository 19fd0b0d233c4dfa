#include "SimulatedCamera.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace sorting_arm::vision {

bool SimulatedCamera::open(const CameraConfig& config) {
    if (config.width <= 0 || config.height <= 0 || config.fps <= 0.0) {
        spdlog::error("SimulatedCamera: invalid configuration {}x{} @ {} fps",
                      config.width, config.height, config.fps);
        return false;
    }
    config_ = config;
    sequence_ = 0;
    nextFrame_ = std::chrono::steady_clock::now();
    open_.store(true);
    spdlog::info("SimulatedCamera opened: {}x{} @ {:.0f} fps", config.width, config.height, config.fps);
    return true;
}

void SimulatedCamera::close() {
    if (open_.exchange(false)) {
        spdlog::info("SimulatedCamera closed after {} frames", sequence_);
    }
}

std::optional<Frame> SimulatedCamera::grab() {
    if (!open_.load()) {
        return std::nullopt;
    }

    std::this_thread::sleep_until(nextFrame_);
    nextFrame_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / config_.fps));

    Frame frame;
    frame.sequence = ++sequence_;
    frame.width = config_.width;
    frame.height = config_.height;
    frame.channels = 3;
    frame.timestamp = std::chrono::steady_clock::now();
    return frame;
}

std::unique_ptr<ICamera> createCamera(const std::string& type) {
    if (type == "simulated" || type == "virtual") {
        return std::make_unique<SimulatedCamera>();
    }
    spdlog::error("Unknown camera type: {}", type);
    return nullptr;
}

} // namespace sorting_arm::vision
