/**
 * @file ArmTypes.hpp
 * @brief Value types shared by every arm driver
 */

#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sorting_arm {
namespace arm {

constexpr int ARM_MAX_JOINTS = 6;

// ============================================================================
// Geometry values
// ============================================================================

/**
 * Cartesian point in the arm frame (mm)
 */
struct Position {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Position() = default;
    Position(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double distanceTo(const Position& other) const;

    bool operator==(const Position& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

    nlohmann::json toJson() const { return {{"x", x}, {"y", y}, {"z", z}}; }
};

/**
 * Joint angles in degrees. Arms with fewer joints leave the tail at zero.
 */
struct JointAngles {
    std::array<double, ARM_MAX_JOINTS> values{};

    JointAngles() = default;
    JointAngles(double j1, double j2, double j3,
                double j4 = 0.0, double j5 = 0.0, double j6 = 0.0)
        : values{j1, j2, j3, j4, j5, j6} {}

    double operator[](size_t i) const { return values[i]; }

    /// Largest absolute per-joint difference (deg)
    double maxDeltaTo(const JointAngles& other) const;

    bool operator==(const JointAngles& other) const { return values == other.values; }

    nlohmann::json toJson() const;
};

// ============================================================================
// Status
// ============================================================================

enum class ArmStatus : uint8_t {
    Disconnected = 0,
    Idle,
    Moving,
    Grabbing,
    Releasing,
    Homing,
    Error
};

inline const char* toString(ArmStatus status) {
    switch (status) {
        case ArmStatus::Disconnected: return "disconnected";
        case ArmStatus::Idle:         return "idle";
        case ArmStatus::Moving:       return "moving";
        case ArmStatus::Grabbing:     return "grabbing";
        case ArmStatus::Releasing:    return "releasing";
        case ArmStatus::Homing:       return "homing";
        case ArmStatus::Error:        return "error";
        default:                      return "unknown";
    }
}

inline bool isBusy(ArmStatus status) {
    return status == ArmStatus::Moving || status == ArmStatus::Grabbing ||
           status == ArmStatus::Releasing || status == ArmStatus::Homing;
}

// ============================================================================
// Configuration / parameters
// ============================================================================

/**
 * Static capabilities of an arm. Fixed at driver construction.
 */
struct ArmConfiguration {
    double max_reach = 800.0;      // mm
    double max_payload = 5.0;      // kg
    int degrees_of_freedom = 6;
    double max_speed = 100.0;      // percent scale used by setSpeed
    double acceleration = 50.0;
    double precision = 0.1;        // repeatability, mm

    nlohmann::json toJson() const;
};

struct GrabParameters {
    double force = 50.0;
    double speed = 50.0;
    double position_tolerance = 2.0;  // mm
    double timeout = 5.0;             // s
};

/**
 * Snapshot returned by IArmDriver::getStatus()
 */
struct ArmStatusReport {
    std::string driver_name;
    bool connected = false;
    ArmStatus status = ArmStatus::Disconnected;
    Position position;
    JointAngles joints;
    bool position_measured = false;   // false: last commanded, not read back
    bool holding_object = false;
    double speed = 50.0;
    std::vector<std::string> errors;

    bool isMoving() const { return isBusy(status); }

    nlohmann::json toJson() const;
};

// ============================================================================
// Sorting bookkeeping
// ============================================================================

/**
 * Destination for one garbage category
 */
struct BinInfo {
    int id = 0;
    std::string category;
    std::string name;
    std::string color;
    Position position;

    nlohmann::json toJson() const;
};

enum class OperationResult : uint8_t {
    Success = 0,
    Failed
};

struct OperationRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string garbage_type;
    OperationResult result = OperationResult::Failed;
    std::optional<Position> target;   // set on success
    std::string error;                // set on failure

    nlohmann::json toJson() const;
};

struct SortingStatistics {
    uint64_t total_operations = 0;
    uint64_t successful_operations = 0;
    uint64_t failed_operations = 0;
    uint64_t grab_count = 0;
    uint64_t release_count = 0;
    uint64_t movement_count = 0;
    std::map<std::string, uint64_t> sorted_per_category;

    double successRate() const {
        return total_operations == 0
            ? 0.0
            : static_cast<double>(successful_operations) / static_cast<double>(total_operations);
    }

    nlohmann::json toJson() const;
};

// ============================================================================
// Parsing helpers for driver configuration dictionaries
// ============================================================================

/**
 * Accepts either {"x":..,"y":..,"z":..} or [x, y, z].
 * Returns nullopt for anything else or non-finite values.
 */
std::optional<Position> positionFromJson(const nlohmann::json& j);

/// Overrides the fields of @p defaults present in @p j
ArmConfiguration configurationFromJson(const nlohmann::json& j, ArmConfiguration defaults);

} // namespace arm
} // namespace sorting_arm
