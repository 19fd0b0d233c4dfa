/**
 * @file SwiftProtocol.hpp
 * @brief Command frames and reply parsing for desktop arms speaking the
 *        uArm Swift G-code dialect
 *
 * Requests are tagged "#<seq> <cmd>", the arm answers "$<seq> ok [data]"
 * or "$<seq> E<code>". Untagged lines ("@..." events) are ignored.
 */

#pragma once

#include "../ArmTypes.hpp"
#include <optional>
#include <string>

namespace sorting_arm {
namespace arm {
namespace serial {

// ============================================================================
// Protocol Constants
// ============================================================================

constexpr int DEFAULT_BAUD_RATE = 115200;
constexpr int RESPONSE_TIMEOUT_MS = 1000;

constexpr const char* CMD_ATTACH_ALL = "M17";
constexpr const char* CMD_DETACH_ALL = "M2019";
constexpr const char* CMD_QUERY_POSITION = "P2220";
constexpr const char* CMD_QUERY_ANGLES = "P2200";
constexpr const char* CMD_QUERY_PUMP = "P2231";
constexpr const char* CMD_QUERY_GRIPPER = "P2232";
constexpr const char* CMD_QUERY_DEVICE = "P2203";

/**
 * Pump/gripper status values returned by P2231 / P2232
 */
enum class EffectorState : int {
    Off = 0,
    Working = 1,
    Holding = 2
};

enum class EndEffector : uint8_t {
    Pump = 0,
    Gripper
};

// ============================================================================
// Formatting
// ============================================================================

/// "G0 X.. Y.. Z.. F.."
std::string formatMove(const Position& target, double feedRate);

/// "G2202 N<servo> V<angle>"
std::string formatServoAngle(int servo, double angleDeg);

/// "M2231 V1" (pump) or "M2232 V1" (gripper)
std::string formatEffector(EndEffector effector, bool on);

/// "#<seq> <command>"
std::string tagCommand(unsigned seq, const std::string& command);

/// Feed rate (mm/min) for a 0-100 speed percentage
double feedRateForSpeed(double speedPercent, double maxFeedRate);

// ============================================================================
// Parsing
// ============================================================================

struct Reply {
    unsigned seq = 0;
    bool ok = false;
    int errorCode = 0;
    std::string payload;   // text after "ok" or the error code
};

/// Parse a "$<seq> ..." line; nullopt for anything else
std::optional<Reply> parseReply(const std::string& line);

/**
 * Position from "X150.00 Y0.00 Z90.00" or "X:150.0 Y:0.0 Z:90.0"
 */
std::optional<Position> parsePosition(const std::string& payload);

/// Joint angles from "B90.00 L45.00 R30.00" (j1..j3)
std::optional<JointAngles> parseAngles(const std::string& payload);

/// Value from "V<n>"
std::optional<int> parseValue(const std::string& payload);

} // namespace serial
} // namespace arm
} // namespace sorting_arm
