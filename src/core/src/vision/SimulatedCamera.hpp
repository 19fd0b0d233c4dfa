#pragma once

#include "ICamera.hpp"
#include <atomic>
#include <chrono>

namespace sorting_arm::vision {

/// Produces blank frames at the configured rate
class SimulatedCamera : public ICamera {
public:
    SimulatedCamera() = default;
    ~SimulatedCamera() override = default;

    bool open(const CameraConfig& config) override;
    void close() override;
    bool isOpen() const override { return open_.load(); }
    std::optional<Frame> grab() override;
    std::string name() const override { return "SimulatedCamera"; }

private:
    CameraConfig config_;
    std::atomic<bool> open_{false};
    uint64_t sequence_ = 0;
    std::chrono::steady_clock::time_point nextFrame_;
};

} // namespace sorting_arm::vision
