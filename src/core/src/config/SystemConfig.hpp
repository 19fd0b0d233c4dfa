/**
 * @file SystemConfig.hpp
 * @brief System and sorting configuration data structures
 */

#pragma once

#include "../geometry/CoordinateTransform.hpp"
#include "../sorting/SortingOrchestrator.hpp"
#include "../vision/ICamera.hpp"
#include "../vision/ScriptedDetector.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sorting_arm {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/sorting_arm.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
};

/**
 * Detection loop configuration
 */
struct ControlConfig {
    int cycle_time_ms = 33;
    int frame_timeout_ms = 500;
    double status_log_interval_s = 10.0;
};

/**
 * Complete system configuration (system_config.yaml)
 */
struct SystemConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    ControlConfig control;
    vision::CameraConfig camera;
};

/**
 * Arm selection and per-driver parameter blocks
 */
struct ArmSettings {
    std::string type = "simulated";
    bool auto_reset_errors = true;
    double auto_reset_delay_s = 2.0;

    // Keyed by driver tag; each value is handed to the driver as-is
    nlohmann::json drivers = nlohmann::json::object();

    /// Parameter block for the selected type, empty object if absent
    nlohmann::json driverConfig() const {
        return driverConfig(type);
    }

    nlohmann::json driverConfig(const std::string& tag) const {
        if (drivers.is_object() && drivers.contains(tag) && drivers[tag].is_object()) {
            return drivers[tag];
        }
        return nlohmann::json::object();
    }
};

/**
 * Complete sorting configuration (sorting_config.yaml)
 */
struct SortingConfig {
    ArmSettings arm;
    geometry::CalibrationPointSet calibration = geometry::CalibrationPointSet::defaults();
    geometry::TransformSettings transform;
    sorting::OrchestratorSettings orchestrator;
    std::vector<vision::DetectionScene> scenes;
};

} // namespace config
} // namespace sorting_arm
