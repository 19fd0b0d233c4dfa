/**
 * @file ArmController.hpp
 * @brief Facade over the active arm driver with runtime driver switching
 *
 * Owns exactly one driver at a time, built through an ArmDriverRegistry.
 * Optional driver capabilities (composite sort, statistics) are queried
 * at call time and degrade to neutral results when absent:
 *   - getStatistics()        -> all-zero statistics
 *   - getOperationHistory()  -> empty list
 *   - resetStatistics()      -> false
 *   - getBinsInfo()          -> empty list
 *   - sortGarbage()/smart grabObject() -> false
 */

#pragma once

#include "../arm/ArmCapabilities.hpp"
#include "../arm/ArmDriverRegistry.hpp"
#include "../arm/IArmDriver.hpp"
#include "../vision/VisionTypes.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sorting_arm {
namespace controller {

/**
 * Grab request carrying what the vision side knows about the object.
 * Routed to the driver's composite sort.
 */
struct SmartGrabRequest {
    std::string category;
    double confidence = 0.0;
    std::optional<arm::Position> position;      // arm frame
    std::optional<vision::BoundingBox> bbox;    // image frame
};

class ArmController {
public:
    /**
     * @param type Driver tag (see ArmDriverRegistry)
     * @param config Driver parameters
     * @throws std::invalid_argument if @p type is not registered
     */
    ArmController(const std::string& type, const nlohmann::json& config,
                  arm::ArmDriverRegistry registry = arm::ArmDriverRegistry::withBuiltinDrivers());
    ~ArmController();

    ArmController(const ArmController&) = delete;
    ArmController& operator=(const ArmController&) = delete;

    // ========================================================================
    // Driver management
    // ========================================================================

    /// Tag of the active driver, empty when none is active
    std::string armType() const;
    bool hasDriver() const;

    /**
     * Replace the active driver. The old driver is disconnected first; the
     * new one is installed only if it connects. On failure the old driver
     * is reconnected and kept, or dropped if it cannot reconnect.
     */
    bool switchArmType(const std::string& type, const nlohmann::json& config);

    bool supportsCompositeSort() const;
    bool supportsStatistics() const;

    // ========================================================================
    // Forwarded driver operations
    // ========================================================================

    bool connect();
    bool disconnect();
    bool isConnected() const;
    bool home();
    bool emergencyStop();
    bool resetErrors();

    /// Disconnected report when no driver is active
    arm::ArmStatusReport getStatus() const;
    arm::ArmStatus status() const;
    std::optional<arm::ArmConfiguration> getConfiguration() const;

    bool moveToPosition(const arm::Position& target, std::optional<double> speed = std::nullopt);
    bool moveToJoints(const arm::JointAngles& joints, std::optional<double> speed = std::nullopt);
    bool setSpeed(double speed);
    bool calibrate();

    /// Bare grab at the current position
    bool grabObject(const arm::GrabParameters& params = arm::GrabParameters{});

    /// Full pick-and-place for a detected object
    bool grabObject(const SmartGrabRequest& request);

    bool releaseObject();

    bool sortGarbage(const std::string& category,
                     std::optional<arm::Position> pickup = std::nullopt);

    // ========================================================================
    // Optional capabilities
    // ========================================================================

    arm::SortingStatistics getStatistics() const;
    std::vector<arm::OperationRecord> getOperationHistory(size_t limit = 10) const;
    bool resetStatistics();
    std::vector<arm::BinInfo> getBinsInfo() const;

    /// Status, configuration and capabilities as one JSON object
    nlohmann::json statusJson() const;

private:
    std::shared_ptr<arm::IArmDriver> driver() const;

    arm::ArmDriverRegistry m_registry;

    mutable std::mutex m_mutex;
    std::shared_ptr<arm::IArmDriver> m_driver;
    std::string m_type;

    // Serializes switchArmType calls
    std::mutex m_switchMutex;
};

/**
 * Scoped connection: connects on construction, disconnects on destruction.
 */
class ArmSession {
public:
    explicit ArmSession(ArmController& controller)
        : m_controller(controller)
        , m_connected(controller.connect()) {
    }

    ~ArmSession() {
        if (m_connected) {
            m_controller.disconnect();
        }
    }

    ArmSession(const ArmSession&) = delete;
    ArmSession& operator=(const ArmSession&) = delete;

    bool connected() const { return m_connected; }

private:
    ArmController& m_controller;
    bool m_connected;
};

} // namespace controller
} // namespace sorting_arm
