/**
 * @file SerialArmDriver.hpp
 * @brief Desktop arm driver over a serial G-code link (uArm Swift dialect)
 */

#pragma once

#include "IArmDriver.hpp"
#include "ArmCapabilities.hpp"
#include "ArmStateMachine.hpp"
#include "BinTable.hpp"
#include "serial/LineTransport.hpp"
#include "serial/SwiftProtocol.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>

namespace sorting_arm {
namespace arm {

/**
 * Link and timing parameters. Delays are in seconds.
 */
struct SerialArmSettings {
    std::string port;                   // empty or "auto": discover
    int baudrate = serial::DEFAULT_BAUD_RATE;
    int timeout_ms = serial::RESPONSE_TIMEOUT_MS;
    double max_feed_rate = 2000.0;      // mm/min at speed 100
    double default_speed = 50.0;
    serial::EndEffector end_effector = serial::EndEffector::Pump;

    double startup_delay = 1.0;
    double command_delay = 0.1;
    double move_settle = 2.0;
    double home_settle = 3.0;
    double grab_settle = 1.0;
    double grab_poll_interval = 0.1;    // effector status poll while a grab takes hold
    double release_settle = 1.0;
    double estop_hold = 0.5;

    Position home_position{115.0, -3.0, 45.0};
    Position pickup_position{200.0, 0.0, -8.0};
    double approach_height = 50.0;

    bool require_ack = false;           // treat a silent arm as a failure
    bool verify_grab = true;            // check the effector status after grabbing

    ArmConfiguration configuration{350.0, 0.5, 3, 100.0, 50.0, 1.0};
    BinTable bins = defaultDesktopArmBins();

    static SerialArmSettings fromJson(const nlohmann::json& j);
};

using PortDiscovery = std::function<std::vector<std::string>()>;

class SerialArmDriver : public IArmDriver, public ICompositeSortCapable {
public:
    /**
     * @param transport Link to use; a Boost.Asio serial transport when null
     * @param discovery Candidate port list used when no port is configured
     */
    explicit SerialArmDriver(SerialArmSettings settings,
                             std::unique_ptr<serial::ILineTransport> transport = nullptr,
                             PortDiscovery discovery = nullptr);
    explicit SerialArmDriver(const nlohmann::json& config);
    ~SerialArmDriver() override;

    // IArmDriver
    bool connect() override;
    bool disconnect() override;
    bool isConnected() const override;
    bool home() override;
    bool emergencyStop() override;
    bool resetErrors() override;
    bool moveToPosition(const Position& target, std::optional<double> speed = std::nullopt) override;
    bool moveToJoints(const JointAngles& joints, std::optional<double> speed = std::nullopt) override;
    std::optional<Position> getCurrentPosition() const override;
    std::optional<JointAngles> getCurrentJoints() const override;
    bool grabObject(const GrabParameters& params = GrabParameters{}) override;
    bool releaseObject() override;
    bool isHoldingObject() const override;
    ArmStatusReport getStatus() const override;
    ArmConfiguration getConfiguration() const override { return m_settings.configuration; }
    std::string getDriverName() const override { return "SerialArm"; }

    // ICompositeSortCapable
    bool sort(const std::string& category,
              std::optional<Position> pickup = std::nullopt) override;
    std::vector<BinInfo> getBins() const override { return m_settings.bins.bins(); }

    /// Port chosen by the last connect()
    std::string activePort() const;

protected:
    bool applySpeed(double speed) override;

private:
    enum class StepResult { Done, Interrupted, Failed };
    enum class CommandResult { Ok, NoReply, Rejected, LinkError };

    std::optional<std::string> resolvePort() const;
    bool validateTarget(const Position& target, std::string& reason) const;
    double resolveSpeed(std::optional<double> speed) const;

    /// Tagged request/response exchange. @p payload receives the reply data.
    CommandResult sendCommand(const std::string& command, std::string* payload = nullptr,
                              int* errorCode = nullptr);

    /// Send a command that is part of a motion, then settle
    StepResult runCommand(const std::string& command, double settleSeconds, uint64_t generation);

    StepResult doMove(const Position& target, double speed, uint64_t generation,
                      double settleSeconds);
    /// Effector on, then wait for a hold until params.timeout runs out
    StepResult doGrab(const GrabParameters& params, uint64_t generation);
    void switchEffectorOff();
    StepResult doRelease(uint64_t generation);

    /// Best-effort readback; keeps the commanded values when the arm is silent
    void refreshPosition();
    void refreshJoints();

    SerialArmSettings m_settings;
    std::unique_ptr<serial::ILineTransport> m_transport;
    PortDiscovery m_discovery;
    ArmStateMachine m_state;

    // Request/response pairs are serialized
    std::mutex m_ioMutex;
    unsigned m_seq = 0;

    mutable std::mutex m_dataMutex;
    std::string m_activePort;
    Position m_position;
    JointAngles m_joints;
    bool m_positionMeasured = false;
    bool m_holding = false;
    double m_speed;
};

} // namespace arm
} // namespace sorting_arm
