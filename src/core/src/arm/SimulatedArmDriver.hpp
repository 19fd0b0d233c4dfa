/**
 * @file SimulatedArmDriver.hpp
 * @brief In-process arm simulation with timing, random grab outcome and statistics
 */

#pragma once

#include "IArmDriver.hpp"
#include "ArmCapabilities.hpp"
#include "ArmStateMachine.hpp"
#include "BinTable.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>

namespace sorting_arm {
namespace arm {

/**
 * Simulation parameters. Durations are in seconds of simulated time and
 * are multiplied by time_scale before sleeping (0 = instant).
 */
struct SimulatedArmSettings {
    Position home_position{0.0, 0.0, 200.0};
    Position pickup_position{400.0, 0.0, 100.0};
    double default_speed = 50.0;
    double time_scale = 1.0;
    double max_move_time = 3.0;
    double joint_speed = 50.0;          // deg/s
    double connect_time = 0.5;
    double grab_time = 1.0;
    double release_time = 0.5;
    double grab_success_rate = 0.9;
    double release_success_rate = 1.0;
    std::optional<uint32_t> seed;
    size_t history_limit = 100;
    ArmConfiguration configuration;
    BinTable bins = defaultSimulatedBins();

    static SimulatedArmSettings fromJson(const nlohmann::json& j);
};

class SimulatedArmDriver : public IArmDriver,
                           public ICompositeSortCapable,
                           public ISortingStatistics {
public:
    explicit SimulatedArmDriver(SimulatedArmSettings settings = SimulatedArmSettings{});
    explicit SimulatedArmDriver(const nlohmann::json& config);
    ~SimulatedArmDriver() override;

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
    std::string getDriverName() const override { return "SimulatedArm"; }

    // ICompositeSortCapable
    bool sort(const std::string& category,
              std::optional<Position> pickup = std::nullopt) override;
    std::vector<BinInfo> getBins() const override { return m_settings.bins.bins(); }

    // ISortingStatistics
    SortingStatistics getStatistics() const override;
    std::vector<OperationRecord> getOperationHistory(size_t limit = 10) const override;
    bool resetStatistics() override;

    const SimulatedArmSettings& settings() const { return m_settings; }

protected:
    bool applySpeed(double speed) override;

private:
    enum class StepResult { Done, Interrupted, Failed };

    /// Joint angles -> tool position, planar demo mapping
    static Position forwardKinematics(const JointAngles& joints);

    bool validateTarget(const Position& target, std::string& reason) const;
    double resolveSpeed(std::optional<double> speed) const;

    // Primitives without gate handling; callers own the state machine
    StepResult doMove(const Position& target, double speed, uint64_t generation);
    StepResult doGrab(const GrabParameters& params, uint64_t generation);
    StepResult doRelease(uint64_t generation);

    /// Sleep scaled time; false if an emergency stop arrived meanwhile
    bool waitFor(double simSeconds, uint64_t generation, double* completedFraction = nullptr);
    bool roll(double probability);

    void recordOperation(const std::string& category, bool success,
                         const std::optional<Position>& target, const std::string& error);

    SimulatedArmSettings m_settings;
    ArmStateMachine m_state;

    // Simulated arm state
    mutable std::mutex m_dataMutex;
    Position m_position;
    JointAngles m_joints;
    bool m_holding = false;
    double m_speed;
    std::mt19937 m_rng;
    SortingStatistics m_stats;
    std::deque<OperationRecord> m_history;

};

} // namespace arm
} // namespace sorting_arm
