/**
 * @file IArmDriver.hpp
 * @brief Abstract interface for arm drivers (simulated, serial G-code)
 *
 * ArmController and SortingOrchestrator only talk to this interface,
 * so drivers can be swapped at runtime. Every public operation reports
 * failure through its return value and the error list in getStatus();
 * none of them throws.
 */

#pragma once

#include "ArmTypes.hpp"
#include <optional>
#include <string>

namespace sorting_arm {
namespace arm {

class IArmDriver {
public:
    virtual ~IArmDriver() = default;

    // ========================================================================
    // Connection
    // ========================================================================

    /// Idempotent: returns true immediately when already connected
    virtual bool connect() = 0;
    virtual bool disconnect() = 0;
    virtual bool isConnected() const = 0;

    // ========================================================================
    // Motion
    // ========================================================================

    virtual bool home() = 0;

    /**
     * Halt immediately, including mid-motion. Leaves a connected arm Idle.
     */
    virtual bool emergencyStop() = 0;

    /// Error -> Idle
    virtual bool resetErrors() = 0;

    virtual bool moveToPosition(const Position& target,
                                std::optional<double> speed = std::nullopt) = 0;
    virtual bool moveToJoints(const JointAngles& joints,
                              std::optional<double> speed = std::nullopt) = 0;

    /// Last known pose; nullopt while disconnected
    virtual std::optional<Position> getCurrentPosition() const = 0;
    virtual std::optional<JointAngles> getCurrentJoints() const = 0;

    // ========================================================================
    // End effector
    // ========================================================================

    virtual bool grabObject(const GrabParameters& params = GrabParameters{}) = 0;
    virtual bool releaseObject() = 0;
    virtual bool isHoldingObject() const = 0;

    // ========================================================================
    // Status
    // ========================================================================

    virtual ArmStatusReport getStatus() const = 0;
    virtual ArmConfiguration getConfiguration() const = 0;
    virtual std::string getDriverName() const = 0;

    // ========================================================================
    // Defaults (drivers may override)
    // ========================================================================

    /// Straight-line move. Point-to-point unless the driver interpolates.
    virtual bool moveLinear(const Position& target, std::optional<double> speed = std::nullopt) {
        return moveToPosition(target, speed);
    }

    /// Arc through @p via to @p target, approximated by two moves
    virtual bool moveCircular(const Position& via, const Position& target,
                              std::optional<double> speed = std::nullopt) {
        return moveToPosition(via, speed) && moveToPosition(target, speed);
    }

    virtual bool calibrate() { return true; }

    /**
     * Set the default motion speed (0-100 percent).
     * Out of range values are rejected before reaching the driver.
     */
    bool setSpeed(double speed) {
        if (!(speed >= 0.0 && speed <= 100.0)) {
            return false;
        }
        return applySpeed(speed);
    }

protected:
    virtual bool applySpeed(double speed) = 0;
};

} // namespace arm
} // namespace sorting_arm
