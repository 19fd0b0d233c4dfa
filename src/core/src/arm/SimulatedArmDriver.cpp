/**
 * @file SimulatedArmDriver.cpp
 * @brief Simulated arm implementation
 */

#include "SimulatedArmDriver.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace sorting_arm {
namespace arm {

SimulatedArmSettings SimulatedArmSettings::fromJson(const nlohmann::json& j) {
    SimulatedArmSettings s;
    if (!j.is_object()) {
        return s;
    }

    if (j.contains("home_position")) {
        if (auto p = positionFromJson(j["home_position"])) s.home_position = *p;
    }
    if (j.contains("pickup_position")) {
        if (auto p = positionFromJson(j["pickup_position"])) s.pickup_position = *p;
    }
    s.default_speed = j.value("speed", s.default_speed);
    s.time_scale = std::max(0.0, j.value("time_scale", s.time_scale));
    s.max_move_time = j.value("max_move_time", s.max_move_time);
    s.joint_speed = j.value("joint_speed", s.joint_speed);
    s.connect_time = j.value("connect_time", s.connect_time);
    s.grab_time = j.value("grab_time", s.grab_time);
    s.release_time = j.value("release_time", s.release_time);
    s.grab_success_rate = std::clamp(j.value("grab_success_rate", s.grab_success_rate), 0.0, 1.0);
    s.release_success_rate = std::clamp(j.value("release_success_rate", s.release_success_rate), 0.0, 1.0);
    if (j.contains("seed") && j["seed"].is_number_integer()) {
        s.seed = j["seed"].get<uint32_t>();
    }
    s.history_limit = j.value("history_limit", s.history_limit);
    if (j.contains("configuration")) {
        s.configuration = configurationFromJson(j["configuration"], s.configuration);
    }
    if (j.contains("bins")) {
        s.bins = BinTable::fromJson(j["bins"], s.bins);
    }
    return s;
}

SimulatedArmDriver::SimulatedArmDriver(SimulatedArmSettings settings)
    : m_settings(std::move(settings))
    , m_position(m_settings.home_position)
    , m_speed(m_settings.default_speed)
    , m_rng(m_settings.seed ? *m_settings.seed : std::random_device{}())
{
    LOG_INFO("SimulatedArm created: {} bins, grab success rate {:.2f}, time scale {}",
             m_settings.bins.size(), m_settings.grab_success_rate, m_settings.time_scale);
}

SimulatedArmDriver::SimulatedArmDriver(const nlohmann::json& config)
    : SimulatedArmDriver(SimulatedArmSettings::fromJson(config)) {
}

SimulatedArmDriver::~SimulatedArmDriver() {
    m_state.interrupt().trigger();
}

// ============================================================================
// Connection
// ============================================================================

bool SimulatedArmDriver::connect() {
    if (m_state.isConnected()) {
        return true;
    }

    LOG_INFO("SimulatedArm connecting...");
    if (!waitFor(m_settings.connect_time, m_state.interrupt().generation())) {
        LOG_WARN("SimulatedArm connect interrupted");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_position = m_settings.home_position;
        m_joints = JointAngles();
        m_holding = false;
    }
    m_state.processEvent(ArmEvent::CONNECTED);
    LOG_INFO("SimulatedArm connected at home ({:.1f}, {:.1f}, {:.1f})",
             m_settings.home_position.x, m_settings.home_position.y, m_settings.home_position.z);
    return true;
}

bool SimulatedArmDriver::disconnect() {
    m_state.processEvent(ArmEvent::DISCONNECTED);
    LOG_INFO("SimulatedArm disconnected");
    return true;
}

bool SimulatedArmDriver::isConnected() const {
    return m_state.isConnected();
}

// ============================================================================
// Motion
// ============================================================================

bool SimulatedArmDriver::home() {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm home: not connected");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::HOME_START, &gen)) {
        LOG_INFO("SimulatedArm home rejected: arm is {}", toString(m_state.status()));
        return false;
    }

    StepResult r = doMove(m_settings.home_position, resolveSpeed(std::nullopt), gen);
    if (r != StepResult::Done) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_joints = JointAngles();
    }
    m_state.completeCommand();
    LOG_DEBUG("SimulatedArm homed");
    return true;
}

bool SimulatedArmDriver::emergencyStop() {
    bool wasConnected = m_state.isConnected();
    m_state.emergencyStop();
    if (wasConnected) {
        LOG_WARN("SimulatedArm EMERGENCY STOP");
    }
    return true;
}

bool SimulatedArmDriver::resetErrors() {
    if (!m_state.isConnected()) {
        return false;
    }
    if (!m_state.reset()) {
        LOG_WARN("SimulatedArm reset rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    LOG_INFO("SimulatedArm errors reset");
    return true;
}

bool SimulatedArmDriver::moveToPosition(const Position& target, std::optional<double> speed) {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm move: not connected");
        return false;
    }
    std::string reason;
    if (!validateTarget(target, reason)) {
        LOG_WARN("SimulatedArm move rejected: {}", reason);
        m_state.addError(reason);
        return false;
    }
    if (speed && !(*speed > 0.0 && *speed <= 100.0)) {
        m_state.addError("Invalid speed: " + std::to_string(*speed));
        return false;
    }

    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SimulatedArm move rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    if (doMove(target, resolveSpeed(speed), gen) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SimulatedArmDriver::moveToJoints(const JointAngles& joints, std::optional<double> speed) {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm joint move: not connected");
        return false;
    }
    for (double v : joints.values) {
        if (!std::isfinite(v) || std::abs(v) > 360.0) {
            m_state.addError("Joint target out of range");
            return false;
        }
    }

    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SimulatedArm joint move rejected: arm is {}", toString(m_state.status()));
        return false;
    }

    JointAngles start;
    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        start = m_joints;
    }
    double scale = resolveSpeed(speed) / 50.0;
    double seconds = std::min(start.maxDeltaTo(joints) / (m_settings.joint_speed * scale),
                              m_settings.max_move_time);
    if (!waitFor(seconds, gen)) {
        LOG_WARN("SimulatedArm joint move interrupted");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_joints = joints;
        m_position = forwardKinematics(joints);
        ++m_stats.movement_count;
    }
    m_state.completeCommand();
    return true;
}

std::optional<Position> SimulatedArmDriver::getCurrentPosition() const {
    if (!m_state.isConnected()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_position;
}

std::optional<JointAngles> SimulatedArmDriver::getCurrentJoints() const {
    if (!m_state.isConnected()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_joints;
}

// ============================================================================
// End effector
// ============================================================================

bool SimulatedArmDriver::grabObject(const GrabParameters& params) {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm grab: not connected");
        return false;
    }
    if (isHoldingObject()) {
        LOG_WARN("SimulatedArm grab rejected: already holding an object");
        m_state.addError("Already holding an object");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::GRAB_START, &gen)) {
        LOG_INFO("SimulatedArm grab rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    if (doGrab(params, gen) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SimulatedArmDriver::releaseObject() {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm release: not connected");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::RELEASE_START, &gen)) {
        LOG_INFO("SimulatedArm release rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    if (doRelease(gen) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SimulatedArmDriver::isHoldingObject() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_holding;
}

ArmStatusReport SimulatedArmDriver::getStatus() const {
    ArmStatusReport report;
    report.driver_name = getDriverName();
    report.status = m_state.status();
    report.connected = report.status != ArmStatus::Disconnected;
    report.errors = m_state.errors();
    report.position_measured = true;

    std::lock_guard<std::mutex> lock(m_dataMutex);
    report.position = m_position;
    report.joints = m_joints;
    report.holding_object = m_holding;
    report.speed = m_speed;
    return report;
}

bool SimulatedArmDriver::applySpeed(double speed) {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_speed = speed;
    LOG_DEBUG("SimulatedArm speed set to {}", speed);
    return true;
}

// ============================================================================
// Composite sort
// ============================================================================

bool SimulatedArmDriver::sort(const std::string& category, std::optional<Position> pickup) {
    if (!m_state.isConnected()) {
        LOG_WARN("SimulatedArm sort: not connected");
        return false;
    }

    auto bin = m_settings.bins.find(category);
    if (!bin) {
        std::string msg = "Unknown garbage type: " + category;
        LOG_WARN("SimulatedArm {}", msg);
        m_state.addError(msg);
        recordOperation(category, false, std::nullopt, msg);
        return false;
    }

    const Position pickPosition = pickup ? *pickup : m_settings.pickup_position;
    std::string reason;
    if (!validateTarget(pickPosition, reason)) {
        LOG_WARN("SimulatedArm sort '{}' rejected: {}", category, reason);
        m_state.addError(reason);
        recordOperation(category, false, std::nullopt, reason);
        return false;
    }

    uint64_t gen = 0;
    if (!m_state.beginSequence(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SimulatedArm sort '{}' rejected: arm is {}", category, toString(m_state.status()));
        return false;
    }

    LOG_INFO("SimulatedArm sorting '{}' from ({:.1f}, {:.1f}) into {}",
             category, pickPosition.x, pickPosition.y, bin->name);
    const double speed = resolveSpeed(std::nullopt);
    std::string failure;

    auto run = [&](StepResult r, const char* stage) {
        if (r == StepResult::Done) return true;
        failure = (r == StepResult::Interrupted)
            ? std::string("Sort interrupted during ") + stage
            : std::string("Sort failed during ") + stage;
        return false;
    };
    auto next = [&](ArmEvent ev, const char* stage) {
        if (m_state.step(ev)) return true;
        failure = std::string("Sort interrupted before ") + stage;
        return false;
    };

    bool ok = run(doMove(pickPosition, speed, gen), "approach")
        && next(ArmEvent::GRAB_START, "grab")
        && run(doGrab(GrabParameters{}, gen), "grab")
        && next(ArmEvent::MOVE_START, "transfer")
        && run(doMove(bin->position, speed, gen), "transfer")
        && next(ArmEvent::RELEASE_START, "release")
        && run(doRelease(gen), "release")
        && next(ArmEvent::HOME_START, "return")
        && run(doMove(m_settings.home_position, speed, gen), "return");

    m_state.endSequence();

    if (!ok) {
        LOG_WARN("SimulatedArm sort '{}': {}", category, failure);
        recordOperation(category, false, std::nullopt, failure);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_joints = JointAngles();
    }
    recordOperation(category, true, bin->position, "");
    LOG_INFO("SimulatedArm sorted '{}' successfully", category);
    return true;
}

// ============================================================================
// Statistics
// ============================================================================

SortingStatistics SimulatedArmDriver::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_stats;
}

std::vector<OperationRecord> SimulatedArmDriver::getOperationHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    size_t n = std::min(limit, m_history.size());
    return std::vector<OperationRecord>(m_history.end() - static_cast<std::ptrdiff_t>(n), m_history.end());
}

bool SimulatedArmDriver::resetStatistics() {
    if (m_state.isBusy()) {
        LOG_WARN("SimulatedArm statistics reset refused while {}", toString(m_state.status()));
        return false;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_stats = SortingStatistics{};
    m_history.clear();
    LOG_INFO("SimulatedArm statistics reset");
    return true;
}

// ============================================================================
// Internals
// ============================================================================

Position SimulatedArmDriver::forwardKinematics(const JointAngles& joints) {
    return Position(400.0 * joints[0] / 90.0 + 100.0,
                    300.0 * joints[1] / 90.0,
                    200.0 + 150.0 * joints[2] / 90.0);
}

bool SimulatedArmDriver::validateTarget(const Position& target, std::string& reason) const {
    if (!std::isfinite(target.x) || !std::isfinite(target.y) || !std::isfinite(target.z)) {
        reason = "Target position is not finite";
        return false;
    }
    double reach = std::sqrt(target.x * target.x + target.y * target.y + target.z * target.z);
    if (reach > m_settings.configuration.max_reach) {
        reason = fmt::format("Target ({:.1f}, {:.1f}, {:.1f}) beyond reach {:.0f} mm",
                             target.x, target.y, target.z, m_settings.configuration.max_reach);
        return false;
    }
    return true;
}

double SimulatedArmDriver::resolveSpeed(std::optional<double> speed) const {
    if (speed) {
        return *speed;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_speed > 0.0 ? m_speed : m_settings.default_speed;
}

SimulatedArmDriver::StepResult SimulatedArmDriver::doMove(const Position& target, double speed,
                                                          uint64_t generation) {
    Position start;
    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        start = m_position;
    }
    double distance = start.distanceTo(target);
    double seconds = std::min(distance / (std::max(speed, 1.0) * 10.0), m_settings.max_move_time);

    double fraction = 1.0;
    bool completed = waitFor(seconds, generation, &fraction);

    std::lock_guard<std::mutex> lock(m_dataMutex);
    if (!completed) {
        // Stop where the arm is
        m_position = Position(start.x + (target.x - start.x) * fraction,
                              start.y + (target.y - start.y) * fraction,
                              start.z + (target.z - start.z) * fraction);
        LOG_WARN("SimulatedArm motion interrupted at ({:.1f}, {:.1f}, {:.1f})",
                 m_position.x, m_position.y, m_position.z);
        return StepResult::Interrupted;
    }
    m_position = target;
    ++m_stats.movement_count;
    LOG_DEBUG("SimulatedArm moved to ({:.1f}, {:.1f}, {:.1f}) in {:.2f}s",
              target.x, target.y, target.z, seconds);
    return StepResult::Done;
}

SimulatedArmDriver::StepResult SimulatedArmDriver::doGrab(const GrabParameters& params,
                                                          uint64_t generation) {
    const double timeout = std::max(params.timeout, 0.0);
    if (timeout < m_settings.grab_time) {
        // The gripper would not close before the caller gives up
        if (!waitFor(timeout, generation)) {
            return StepResult::Interrupted;
        }
        m_state.fail(fmt::format("Grab timed out after {:.2f}s", timeout));
        return StepResult::Failed;
    }
    if (!waitFor(m_settings.grab_time, generation)) {
        return StepResult::Interrupted;
    }

    if (!roll(m_settings.grab_success_rate)) {
        m_state.fail("Grab failed: object not secured");
        return StepResult::Failed;
    }

    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_holding = true;
    ++m_stats.grab_count;
    LOG_DEBUG("SimulatedArm grabbed object (force {:.0f})", params.force);
    return StepResult::Done;
}

SimulatedArmDriver::StepResult SimulatedArmDriver::doRelease(uint64_t generation) {
    if (!waitFor(m_settings.release_time, generation)) {
        return StepResult::Interrupted;
    }

    if (!roll(m_settings.release_success_rate)) {
        m_state.fail("Release failed: gripper did not open");
        return StepResult::Failed;
    }

    std::lock_guard<std::mutex> lock(m_dataMutex);
    if (!m_holding) {
        LOG_DEBUG("SimulatedArm release with empty gripper");
    }
    m_holding = false;
    ++m_stats.release_count;
    return StepResult::Done;
}

bool SimulatedArmDriver::waitFor(double simSeconds, uint64_t generation, double* completedFraction) {
    return m_state.interrupt().waitFor(simSeconds * m_settings.time_scale, generation, completedFraction);
}

bool SimulatedArmDriver::roll(double probability) {
    if (probability >= 1.0) return true;
    if (probability <= 0.0) return false;
    std::lock_guard<std::mutex> lock(m_dataMutex);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_rng) < probability;
}

void SimulatedArmDriver::recordOperation(const std::string& category, bool success,
                                         const std::optional<Position>& target,
                                         const std::string& error) {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    ++m_stats.total_operations;
    if (success) {
        ++m_stats.successful_operations;
        ++m_stats.sorted_per_category[category];
    } else {
        ++m_stats.failed_operations;
    }

    OperationRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.garbage_type = category;
    record.result = success ? OperationResult::Success : OperationResult::Failed;
    record.target = target;
    record.error = error;
    m_history.push_back(std::move(record));
    while (m_history.size() > m_settings.history_limit) {
        m_history.pop_front();
    }
}

} // namespace arm
} // namespace sorting_arm
