/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <filesystem>

namespace sorting_arm {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlToJson(item));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yamlToJson(kv.second);
            }
            return obj;
        }

        case YAML::NodeType::Scalar:
        default:
            break;
    }

    // Quoted scalars carry the non-specific "!" tag
    if (node.Tag() == "!") {
        return node.Scalar();
    }

    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    return node.Scalar();
}

namespace {

/// [[x, y], ...] or [{x: .., y: ..}, ...]
std::vector<geometry::Point2D> parsePoints(const YAML::Node& node) {
    std::vector<geometry::Point2D> points;
    for (const auto& p : node) {
        if (p.IsSequence() && p.size() >= 2) {
            points.emplace_back(p[0].as<double>(), p[1].as<double>());
        } else if (p.IsMap()) {
            points.emplace_back(p["x"].as<double>(), p["y"].as<double>());
        } else {
            throw YAML::Exception(p.Mark(), "calibration point must be [x, y] or {x, y}");
        }
    }
    return points;
}

vision::Detection parseDetection(const YAML::Node& node) {
    vision::Detection det;
    det.class_name = node["class_name"] ? node["class_name"].as<std::string>()
                                        : node["class"].as<std::string>();
    det.confidence = node["confidence"].as<double>(1.0);
    auto bbox = node["bbox"];
    if (!bbox || !bbox.IsSequence() || bbox.size() != 4) {
        throw YAML::Exception(node.Mark(), "detection bbox must be [x1, y1, x2, y2]");
    }
    det.bbox.x1 = bbox[0].as<double>();
    det.bbox.y1 = bbox[1].as<double>();
    det.bbox.x2 = bbox[2].as<double>();
    det.bbox.y2 = bbox[3].as<double>();
    return det;
}

sorting::SelectionPolicy parsePolicy(const std::string& name) {
    if (name == "first" || name == "first_in_frame") {
        return sorting::SelectionPolicy::FirstInFrame;
    }
    if (name != "highest_confidence") {
        LOG_WARN("Unknown selection policy '{}', using highest_confidence", name);
    }
    return sorting::SelectionPolicy::HighestConfidence;
}

const char* policyName(sorting::SelectionPolicy policy) {
    return policy == sorting::SelectionPolicy::FirstInFrame ? "first_in_frame" : "highest_confidence";
}

json pointsToJson(const std::vector<geometry::Point2D>& points) {
    json arr = json::array();
    for (const auto& p : points) {
        arr.push_back({p.x, p.y});
    }
    return arr;
}

} // namespace

// ============================================================================
// System configuration
// ============================================================================

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        LOG_ERROR("System config file not found: {}", filepath);
        return false;
    }

    LOG_INFO("Loading system config from: {}", filepath);
    try {
        return parseSystem(YAML::LoadFile(filepath));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadSystemConfigFromString(const std::string& yaml) {
    try {
        return parseSystem(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::parseSystem(const YAML::Node& root) {
    YAML::Node system = root["system"];
    if (!system) {
        LOG_ERROR("Missing 'system' section in config");
        return false;
    }

    SystemConfig cfg;
    try {
        cfg.version = system["version"].as<std::string>(cfg.version);

        if (system["logging"]) {
            auto logging = system["logging"];
            cfg.logging.level = logging["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = logging["file"].as<std::string>(cfg.logging.file);
            cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(cfg.logging.max_size_mb);
            cfg.logging.max_files = logging["max_files"].as<int>(cfg.logging.max_files);
            cfg.logging.console_enabled = logging["console_enabled"].as<bool>(cfg.logging.console_enabled);
        }

        if (system["control"]) {
            auto control = system["control"];
            cfg.control.cycle_time_ms = control["cycle_time_ms"].as<int>(cfg.control.cycle_time_ms);
            cfg.control.frame_timeout_ms = control["frame_timeout_ms"].as<int>(cfg.control.frame_timeout_ms);
            cfg.control.status_log_interval_s =
                control["status_log_interval_s"].as<double>(cfg.control.status_log_interval_s);
        }

        if (system["camera"]) {
            auto camera = system["camera"];
            cfg.camera.type = camera["type"].as<std::string>(cfg.camera.type);
            cfg.camera.deviceIndex = camera["device_index"].as<int>(cfg.camera.deviceIndex);
            cfg.camera.width = camera["width"].as<int>(cfg.camera.width);
            cfg.camera.height = camera["height"].as<int>(cfg.camera.height);
            cfg.camera.fps = camera["fps"].as<double>(cfg.camera.fps);
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid value in system config: {}", e.what());
        return false;
    }

    if (cfg.control.cycle_time_ms <= 0 || cfg.camera.width <= 0 || cfg.camera.height <= 0) {
        LOG_ERROR("System config validation failed: cycle time and camera size must be positive");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_system_config = cfg;
    m_system_loaded = true;
    LOG_INFO("System config loaded: version {}", cfg.version);
    return true;
}

// ============================================================================
// Sorting configuration
// ============================================================================

bool ConfigManager::loadSortingConfig(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        LOG_ERROR("Sorting config file not found: {}", filepath);
        return false;
    }

    LOG_INFO("Loading sorting config from: {}", filepath);
    try {
        return parseSorting(YAML::LoadFile(filepath));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in sorting config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadSortingConfigFromString(const std::string& yaml) {
    try {
        return parseSorting(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in sorting config: {}", e.what());
        return false;
    }
}

bool ConfigManager::parseSorting(const YAML::Node& root) {
    YAML::Node sorting = root["sorting"];
    if (!sorting) {
        LOG_ERROR("Missing 'sorting' section in config");
        return false;
    }

    SortingConfig cfg;
    try {
        if (sorting["arm"]) {
            auto arm = sorting["arm"];
            cfg.arm.type = arm["type"].as<std::string>(cfg.arm.type);
            cfg.arm.auto_reset_errors = arm["auto_reset_errors"].as<bool>(cfg.arm.auto_reset_errors);
            cfg.arm.auto_reset_delay_s = arm["auto_reset_delay_s"].as<double>(cfg.arm.auto_reset_delay_s);
            if (arm["drivers"]) {
                cfg.arm.drivers = yamlToJson(arm["drivers"]);
                if (!cfg.arm.drivers.is_object()) {
                    LOG_ERROR("'sorting.arm.drivers' must be a map of driver tag to parameters");
                    return false;
                }
            }
        }

        if (sorting["calibration"]) {
            auto cal = sorting["calibration"];
            cfg.calibration.image_points = parsePoints(cal["image_points"]);
            cfg.calibration.robot_points = parsePoints(cal["robot_points"]);
            cfg.transform.image_width = cal["image_width"].as<double>(cfg.transform.image_width);
            cfg.transform.image_height = cal["image_height"].as<double>(cfg.transform.image_height);
        }

        if (sorting["workspace"]) {
            auto ws = sorting["workspace"];
            cfg.transform.workspace.x_min = ws["x_min"].as<double>(cfg.transform.workspace.x_min);
            cfg.transform.workspace.x_max = ws["x_max"].as<double>(cfg.transform.workspace.x_max);
            cfg.transform.workspace.y_min = ws["y_min"].as<double>(cfg.transform.workspace.y_min);
            cfg.transform.workspace.y_max = ws["y_max"].as<double>(cfg.transform.workspace.y_max);
        }
        cfg.transform.pick_height = sorting["pick_height"].as<double>(cfg.transform.pick_height);

        if (sorting["orchestrator"]) {
            auto orch = sorting["orchestrator"];
            cfg.orchestrator.stable_threshold =
                orch["stable_threshold"].as<int>(cfg.orchestrator.stable_threshold);
            cfg.orchestrator.position_tolerance =
                orch["position_tolerance"].as<double>(cfg.orchestrator.position_tolerance);
            cfg.orchestrator.min_confidence =
                orch["min_confidence"].as<double>(cfg.orchestrator.min_confidence);
            if (orch["selection"]) {
                cfg.orchestrator.policy = parsePolicy(orch["selection"].as<std::string>());
            }
        }

        if (sorting["detector"] && sorting["detector"]["scenes"]) {
            for (const auto& s : sorting["detector"]["scenes"]) {
                vision::DetectionScene scene;
                scene.frames = s["frames"].as<int>(1);
                if (s["detections"]) {
                    for (const auto& d : s["detections"]) {
                        scene.detections.push_back(parseDetection(d));
                    }
                }
                cfg.scenes.push_back(std::move(scene));
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid value in sorting config: {}", e.what());
        return false;
    }

    // Validate
    auto calError = geometry::CoordinateTransform::validatePoints(cfg.calibration.image_points,
                                                                  cfg.calibration.robot_points);
    if (!calError.empty()) {
        LOG_ERROR("Sorting config calibration invalid: {}", calError);
        return false;
    }
    if (!cfg.transform.workspace.isValid()) {
        LOG_ERROR("Sorting config workspace invalid: x [{}, {}], y [{}, {}]",
                  cfg.transform.workspace.x_min, cfg.transform.workspace.x_max,
                  cfg.transform.workspace.y_min, cfg.transform.workspace.y_max);
        return false;
    }
    if (cfg.orchestrator.stable_threshold < 1 || cfg.orchestrator.position_tolerance < 0.0) {
        LOG_ERROR("Sorting config orchestrator invalid: threshold {}, tolerance {}",
                  cfg.orchestrator.stable_threshold, cfg.orchestrator.position_tolerance);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sorting_config = cfg;
    m_sorting_loaded = true;
    LOG_INFO("Sorting config loaded: arm '{}', {} calibration points, {} detector scenes",
             cfg.arm.type, cfg.calibration.image_points.size(), cfg.scenes.size());
    return true;
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    std::string system_path = config_dir + "/system_config.yaml";
    std::string sorting_path = config_dir + "/sorting_config.yaml";

    bool system_ok = loadSystemConfig(system_path);
    bool sorting_ok = loadSortingConfig(sorting_path);
    return system_ok && sorting_ok;
}

// ============================================================================
// Accessors
// ============================================================================

SystemConfig ConfigManager::systemConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_system_config;
}

SortingConfig ConfigManager::sortingConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sorting_config;
}

bool ConfigManager::isLoaded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_system_loaded && m_sorting_loaded;
}

json ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_system_config.version;

    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file}
    };

    j["control"] = {
        {"cycle_time_ms", m_system_config.control.cycle_time_ms},
        {"frame_timeout_ms", m_system_config.control.frame_timeout_ms}
    };

    j["camera"] = {
        {"type", m_system_config.camera.type},
        {"width", m_system_config.camera.width},
        {"height", m_system_config.camera.height},
        {"fps", m_system_config.camera.fps}
    };

    return j;
}

json ConfigManager::sortingConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& c = m_sorting_config;

    json j;
    j["arm"] = {
        {"type", c.arm.type},
        {"auto_reset_errors", c.arm.auto_reset_errors},
        {"drivers", c.arm.drivers}
    };

    j["calibration"] = {
        {"image_points", pointsToJson(c.calibration.image_points)},
        {"robot_points", pointsToJson(c.calibration.robot_points)}
    };

    j["workspace"] = {
        {"x_min", c.transform.workspace.x_min},
        {"x_max", c.transform.workspace.x_max},
        {"y_min", c.transform.workspace.y_min},
        {"y_max", c.transform.workspace.y_max}
    };
    j["pick_height"] = c.transform.pick_height;

    j["orchestrator"] = {
        {"stable_threshold", c.orchestrator.stable_threshold},
        {"position_tolerance", c.orchestrator.position_tolerance},
        {"min_confidence", c.orchestrator.min_confidence},
        {"selection", policyName(c.orchestrator.policy)}
    };
    j["detector_scenes"] = c.scenes.size();

    return j;
}

} // namespace config
} // namespace sorting_arm
