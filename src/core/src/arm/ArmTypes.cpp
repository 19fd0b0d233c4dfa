/**
 * @file ArmTypes.cpp
 * @brief JSON views of the arm value types
 */

#include "ArmTypes.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sorting_arm {
namespace arm {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

double Position::distanceTo(const Position& other) const {
    const double dx = other.x - x;
    const double dy = other.y - y;
    const double dz = other.z - z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

double JointAngles::maxDeltaTo(const JointAngles& other) const {
    double maxDelta = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        maxDelta = std::max(maxDelta, std::abs(other.values[i] - values[i]));
    }
    return maxDelta;
}

nlohmann::json JointAngles::toJson() const {
    nlohmann::json j;
    for (size_t i = 0; i < values.size(); ++i) {
        j["j" + std::to_string(i + 1)] = values[i];
    }
    return j;
}

nlohmann::json ArmConfiguration::toJson() const {
    return {
        {"max_reach", max_reach},
        {"max_payload", max_payload},
        {"degrees_of_freedom", degrees_of_freedom},
        {"max_speed", max_speed},
        {"acceleration", acceleration},
        {"precision", precision}
    };
}

nlohmann::json ArmStatusReport::toJson() const {
    return {
        {"driver", driver_name},
        {"connected", connected},
        {"status", toString(status)},
        {"position", position.toJson()},
        {"joints", joints.toJson()},
        {"position_measured", position_measured},
        {"is_moving", isMoving()},
        {"has_object", holding_object},
        {"speed", speed},
        {"errors", errors}
    };
}

nlohmann::json BinInfo::toJson() const {
    return {
        {"id", id},
        {"category", category},
        {"name", name},
        {"color", color},
        {"position", position.toJson()}
    };
}

nlohmann::json OperationRecord::toJson() const {
    nlohmann::json j = {
        {"timestamp", formatTimestamp(timestamp)},
        {"garbage_type", garbage_type},
        {"status", result == OperationResult::Success ? "success" : "failed"}
    };
    if (target) {
        j["position"] = target->toJson();
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

nlohmann::json SortingStatistics::toJson() const {
    return {
        {"total_operations", total_operations},
        {"successful_operations", successful_operations},
        {"failed_operations", failed_operations},
        {"success_rate", successRate()},
        {"grab_count", grab_count},
        {"release_count", release_count},
        {"movement_count", movement_count},
        {"garbage_sorted", sorted_per_category}
    };
}

std::optional<Position> positionFromJson(const nlohmann::json& j) {
    Position p;
    if (j.is_array() && j.size() == 3 &&
        j[0].is_number() && j[1].is_number() && j[2].is_number()) {
        p = Position(j[0].get<double>(), j[1].get<double>(), j[2].get<double>());
    } else if (j.is_object() && j.contains("x") && j.contains("y") &&
               j["x"].is_number() && j["y"].is_number()) {
        double z = (j.contains("z") && j["z"].is_number()) ? j["z"].get<double>() : 0.0;
        p = Position(j["x"].get<double>(), j["y"].get<double>(), z);
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
        return std::nullopt;
    }
    return p;
}

ArmConfiguration configurationFromJson(const nlohmann::json& j, ArmConfiguration defaults) {
    if (!j.is_object()) {
        return defaults;
    }
    defaults.max_reach = j.value("max_reach", defaults.max_reach);
    defaults.max_payload = j.value("max_payload", defaults.max_payload);
    defaults.degrees_of_freedom = j.value("degrees_of_freedom", defaults.degrees_of_freedom);
    defaults.max_speed = j.value("max_speed", defaults.max_speed);
    defaults.acceleration = j.value("acceleration", defaults.acceleration);
    defaults.precision = j.value("precision", defaults.precision);
    return defaults;
}

} // namespace arm
} // namespace sorting_arm
