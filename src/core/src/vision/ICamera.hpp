#pragma once

#include "VisionTypes.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sorting_arm::vision {

/// Camera configuration
struct CameraConfig {
    std::string type = "simulated";
    int deviceIndex = 0;
    int width = 640;
    int height = 480;
    double fps = 30.0;
};

/// Abstract interface for frame producers
class ICamera {
public:
    virtual ~ICamera() = default;

    virtual bool open(const CameraConfig& config) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /// Block until the next frame is available. nullopt on failure or when closed.
    virtual std::optional<Frame> grab() = 0;

    virtual std::string name() const = 0;
};

/// Factory function to create camera by type. nullptr for unknown types.
std::unique_ptr<ICamera> createCamera(const std::string& type = "simulated");

} // namespace sorting_arm::vision
