/**
 * @file SerialArmDriver.cpp
 * @brief Serial G-code arm driver implementation
 */

#include "SerialArmDriver.hpp"
#include "serial/SerialLineTransport.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace sorting_arm {
namespace arm {

SerialArmSettings SerialArmSettings::fromJson(const nlohmann::json& j) {
    SerialArmSettings s;
    if (!j.is_object()) {
        return s;
    }

    if (j.contains("port") && j["port"].is_string()) {
        s.port = j["port"].get<std::string>();
    }
    s.baudrate = j.value("baudrate", s.baudrate);
    if (j.contains("timeout")) {
        s.timeout_ms = static_cast<int>(j.value("timeout", 1.0) * 1000.0);
    }
    s.timeout_ms = j.value("timeout_ms", s.timeout_ms);
    s.max_feed_rate = j.value("max_feed_rate", s.max_feed_rate);
    s.default_speed = std::clamp(j.value("speed_factor", s.default_speed), 1.0, 100.0);
    s.default_speed = std::clamp(j.value("speed", s.default_speed), 1.0, 100.0);
    if (j.value("end_effector", std::string("pump")) == "gripper") {
        s.end_effector = serial::EndEffector::Gripper;
    }

    s.startup_delay = j.value("startup_delay", s.startup_delay);
    s.command_delay = j.value("command_delay", s.command_delay);
    s.move_settle = j.value("move_settle", s.move_settle);
    s.home_settle = j.value("home_settle", s.home_settle);
    s.grab_settle = j.value("grab_settle", s.grab_settle);
    s.grab_poll_interval = std::max(j.value("grab_poll_interval", s.grab_poll_interval), 0.001);
    s.release_settle = j.value("release_settle", s.release_settle);
    s.estop_hold = j.value("estop_hold", s.estop_hold);

    if (j.contains("home_position")) {
        if (auto p = positionFromJson(j["home_position"])) s.home_position = *p;
    }
    if (j.contains("pickup_position")) {
        if (auto p = positionFromJson(j["pickup_position"])) s.pickup_position = *p;
    }
    s.approach_height = j.value("approach_height", s.approach_height);
    s.require_ack = j.value("require_ack", s.require_ack);
    s.verify_grab = j.value("verify_grab", s.verify_grab);

    if (j.contains("configuration")) {
        s.configuration = configurationFromJson(j["configuration"], s.configuration);
    }
    if (j.contains("bins")) {
        s.bins = BinTable::fromJson(j["bins"], s.bins);
    }
    return s;
}

SerialArmDriver::SerialArmDriver(SerialArmSettings settings,
                                 std::unique_ptr<serial::ILineTransport> transport,
                                 PortDiscovery discovery)
    : m_settings(std::move(settings))
    , m_transport(std::move(transport))
    , m_discovery(std::move(discovery))
    , m_position(m_settings.home_position)
    , m_speed(m_settings.default_speed)
{
    if (!m_transport) {
        m_transport = std::make_unique<serial::SerialLineTransport>();
    }
    if (!m_discovery) {
        m_discovery = serial::discoverSerialPorts;
    }
}

SerialArmDriver::SerialArmDriver(const nlohmann::json& config)
    : SerialArmDriver(SerialArmSettings::fromJson(config)) {
}

SerialArmDriver::~SerialArmDriver() {
    m_state.interrupt().trigger();
    if (m_transport && m_transport->isOpen()) {
        m_transport->close();
    }
}

// ============================================================================
// Connection
// ============================================================================

std::optional<std::string> SerialArmDriver::resolvePort() const {
    if (!m_settings.port.empty() && m_settings.port != "auto" && m_settings.port != "AUTO") {
        LOG_INFO("SerialArm using configured port {}", m_settings.port);
        return m_settings.port;
    }

    auto ports = m_discovery();
    if (ports.empty()) {
        return std::nullopt;
    }
    LOG_INFO("SerialArm detected device {}", ports.front());
    return ports.front();
}

bool SerialArmDriver::connect() {
    if (m_state.isConnected()) {
        return true;
    }

    auto port = resolvePort();
    if (!port) {
        LOG_ERROR("SerialArm: no serial device found");
        m_state.addError("No serial device found");
        return false;
    }

    serial::LinkConfig link;
    link.portName = *port;
    link.baudRate = m_settings.baudrate;
    if (!m_transport->open(link)) {
        std::string reason = m_transport->lastError();
        LOG_ERROR("SerialArm: cannot open {}: {}", *port, reason);
        m_state.addError("Cannot open " + *port + ": " + reason);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_activePort = *port;
    }

    // The controller resets when the port opens
    if (!m_state.interrupt().waitFor(m_settings.startup_delay, m_state.interrupt().generation())) {
        m_transport->close();
        return false;
    }
    m_transport->clearInput();

    CommandResult attach = sendCommand(serial::CMD_ATTACH_ALL);
    if (attach == CommandResult::LinkError) {
        std::string reason = m_transport->lastError();
        LOG_ERROR("SerialArm: link failed during connect: {}", reason);
        m_state.addError("Link failure during connect: " + reason);
        m_transport->close();
        return false;
    }

    std::string device;
    CommandResult info = sendCommand(serial::CMD_QUERY_DEVICE, &device);
    if (info == CommandResult::Ok) {
        LOG_INFO("SerialArm device: {}", device);
    } else if (m_settings.require_ack) {
        LOG_ERROR("SerialArm: device on {} does not answer", *port);
        m_state.addError("Device on " + *port + " does not answer");
        m_transport->close();
        return false;
    } else {
        LOG_WARN("SerialArm: device on {} does not answer queries, continuing", *port);
    }

    m_state.processEvent(ArmEvent::CONNECTED);
    refreshPosition();
    refreshJoints();
    LOG_INFO("SerialArm connected on {} at {} baud", *port, m_settings.baudrate);
    return true;
}

bool SerialArmDriver::disconnect() {
    m_state.interrupt().trigger();
    {
        std::lock_guard<std::mutex> lock(m_ioMutex);
        if (m_transport->isOpen()) {
            m_transport->close();
        }
    }
    m_state.processEvent(ArmEvent::DISCONNECTED);
    LOG_INFO("SerialArm disconnected");
    return true;
}

bool SerialArmDriver::isConnected() const {
    return m_state.isConnected();
}

std::string SerialArmDriver::activePort() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_activePort;
}

// ============================================================================
// Motion
// ============================================================================

bool SerialArmDriver::home() {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm home: not connected");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::HOME_START, &gen)) {
        LOG_INFO("SerialArm home rejected: arm is {}", toString(m_state.status()));
        return false;
    }

    LOG_INFO("SerialArm homing...");
    if (runCommand(serial::CMD_ATTACH_ALL, 0.0, gen) != StepResult::Done) {
        return false;
    }
    if (doMove(m_settings.home_position, resolveSpeed(std::nullopt), gen,
               m_settings.home_settle) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    LOG_INFO("SerialArm homed");
    return true;
}

bool SerialArmDriver::emergencyStop() {
    const bool wasConnected = m_state.isConnected();
    m_state.emergencyStop();
    if (!wasConnected) {
        return true;
    }

    LOG_WARN("SerialArm EMERGENCY STOP");
    // Untagged so the reply cannot be mistaken for a pending request's
    bool linkOk = m_transport->writeLine(serial::CMD_DETACH_ALL);
    if (linkOk && m_settings.estop_hold > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(m_settings.estop_hold));
    }
    linkOk = linkOk && m_transport->writeLine(serial::CMD_ATTACH_ALL);

    if (!linkOk) {
        std::string reason = "Emergency stop not delivered: " + m_transport->lastError();
        LOG_ERROR("SerialArm {}", reason);
        m_state.addError(reason);
        return false;
    }
    return true;
}

bool SerialArmDriver::resetErrors() {
    if (!m_state.isConnected()) {
        return false;
    }
    if (!m_state.reset()) {
        LOG_WARN("SerialArm reset rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    LOG_INFO("SerialArm errors reset");
    return true;
}

bool SerialArmDriver::moveToPosition(const Position& target, std::optional<double> speed) {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm move: not connected");
        return false;
    }
    std::string reason;
    if (!validateTarget(target, reason)) {
        LOG_WARN("SerialArm move rejected: {}", reason);
        m_state.addError(reason);
        return false;
    }

    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SerialArm move rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    if (doMove(target, resolveSpeed(speed), gen, m_settings.move_settle) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SerialArmDriver::moveToJoints(const JointAngles& joints, std::optional<double> /*speed*/) {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm joint move: not connected");
        return false;
    }
    // Base, left and right servos take 0-180 degrees
    for (int i = 0; i < 3; ++i) {
        if (!(joints[i] >= 0.0 && joints[i] <= 180.0)) {
            m_state.addError("Joint " + std::to_string(i + 1) + " target out of range");
            return false;
        }
    }
    // Servo angle moves run at the firmware's own rate

    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SerialArm joint move rejected: arm is {}", toString(m_state.status()));
        return false;
    }

    for (int servo = 0; servo < 3; ++servo) {
        double settle = servo == 2 ? m_settings.move_settle : 0.0;
        if (runCommand(serial::formatServoAngle(servo, joints[servo]), settle, gen) != StepResult::Done) {
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_joints = JointAngles(joints[0], joints[1], joints[2]);
    }
    refreshJoints();
    refreshPosition();
    m_state.completeCommand();
    return true;
}

std::optional<Position> SerialArmDriver::getCurrentPosition() const {
    if (!m_state.isConnected()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_position;
}

std::optional<JointAngles> SerialArmDriver::getCurrentJoints() const {
    if (!m_state.isConnected()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_joints;
}

// ============================================================================
// End effector
// ============================================================================

bool SerialArmDriver::grabObject(const GrabParameters& params) {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm grab: not connected");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::GRAB_START, &gen)) {
        LOG_INFO("SerialArm grab rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    LOG_DEBUG("SerialArm grabbing (timeout {:.1f}s)", params.timeout);
    if (doGrab(params, gen) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SerialArmDriver::releaseObject() {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm release: not connected");
        return false;
    }
    uint64_t gen = 0;
    if (!m_state.beginCommand(ArmEvent::RELEASE_START, &gen)) {
        LOG_INFO("SerialArm release rejected: arm is {}", toString(m_state.status()));
        return false;
    }
    if (doRelease(gen) != StepResult::Done) {
        return false;
    }
    m_state.completeCommand();
    return true;
}

bool SerialArmDriver::isHoldingObject() const {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_holding;
}

ArmStatusReport SerialArmDriver::getStatus() const {
    ArmStatusReport report;
    report.driver_name = getDriverName();
    report.status = m_state.status();
    report.connected = report.status != ArmStatus::Disconnected;
    report.errors = m_state.errors();

    std::lock_guard<std::mutex> lock(m_dataMutex);
    report.position = m_position;
    report.joints = m_joints;
    report.position_measured = m_positionMeasured;
    report.holding_object = m_holding;
    report.speed = m_speed;
    return report;
}

bool SerialArmDriver::applySpeed(double speed) {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_speed = std::max(speed, 1.0);
    return true;
}

// ============================================================================
// Composite sort
// ============================================================================

bool SerialArmDriver::sort(const std::string& category, std::optional<Position> pickup) {
    if (!m_state.isConnected()) {
        LOG_WARN("SerialArm sort: not connected");
        return false;
    }

    auto bin = m_settings.bins.find(category);
    if (!bin) {
        std::string msg = "Unknown garbage type: " + category;
        LOG_WARN("SerialArm {}", msg);
        m_state.addError(msg);
        return false;
    }

    const Position pick = pickup ? *pickup : m_settings.pickup_position;
    const Position above(pick.x, pick.y, m_settings.approach_height);
    const Position binAbove(bin->position.x, bin->position.y,
                            std::max(bin->position.z, m_settings.approach_height));
    std::string reason;
    if (!validateTarget(pick, reason) || !validateTarget(binAbove, reason)) {
        LOG_WARN("SerialArm sort '{}' rejected: {}", category, reason);
        m_state.addError(reason);
        return false;
    }

    uint64_t gen = 0;
    if (!m_state.beginSequence(ArmEvent::MOVE_START, &gen)) {
        LOG_INFO("SerialArm sort '{}' rejected: arm is {}", category, toString(m_state.status()));
        return false;
    }

    LOG_INFO("SerialArm sorting '{}' from ({:.1f}, {:.1f}) into {}", category, pick.x, pick.y, bin->name);
    const double speed = resolveSpeed(std::nullopt);
    const double settle = m_settings.move_settle;
    std::string failure;

    auto run = [&](StepResult r, const char* stage) {
        if (r == StepResult::Done) return true;
        failure = (r == StepResult::Interrupted)
            ? std::string("interrupted during ") + stage
            : std::string("failed during ") + stage;
        return false;
    };
    auto next = [&](ArmEvent ev, const char* stage) {
        if (m_state.step(ev)) return true;
        failure = std::string("interrupted before ") + stage;
        return false;
    };

    bool ok = run(doMove(above, speed, gen, settle), "approach")
        && run(doMove(pick, speed, gen, settle), "descent")
        && next(ArmEvent::GRAB_START, "grab")
        && run(doGrab(GrabParameters{}, gen), "grab")
        && next(ArmEvent::MOVE_START, "lift")
        && run(doMove(above, speed, gen, settle), "lift")
        && run(doMove(binAbove, speed, gen, settle), "transfer")
        && next(ArmEvent::RELEASE_START, "release")
        && run(doRelease(gen), "release")
        && next(ArmEvent::HOME_START, "return")
        && run(doMove(m_settings.home_position, speed, gen, settle), "return");

    m_state.endSequence();

    if (!ok) {
        LOG_WARN("SerialArm sort '{}' {}", category, failure);
        return false;
    }
    LOG_INFO("SerialArm sorted '{}'", category);
    return true;
}

// ============================================================================
// Internals
// ============================================================================

bool SerialArmDriver::validateTarget(const Position& target, std::string& reason) const {
    if (!std::isfinite(target.x) || !std::isfinite(target.y) || !std::isfinite(target.z)) {
        reason = "Target position is not finite";
        return false;
    }
    double radius = std::hypot(target.x, target.y);
    if (radius > m_settings.configuration.max_reach) {
        reason = fmt::format("Target ({:.1f}, {:.1f}) beyond reach {:.0f} mm",
                             target.x, target.y, m_settings.configuration.max_reach);
        return false;
    }
    return true;
}

double SerialArmDriver::resolveSpeed(std::optional<double> speed) const {
    if (speed) {
        return *speed;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    return m_speed;
}

SerialArmDriver::CommandResult SerialArmDriver::sendCommand(const std::string& command,
                                                            std::string* payload,
                                                            int* errorCode) {
    std::lock_guard<std::mutex> lock(m_ioMutex);
    try {
        if (!m_transport->isOpen()) {
            return CommandResult::LinkError;
        }

        const unsigned seq = ++m_seq;
        LOG_TRACE("SerialArm >> #{} {}", seq, command);
        if (!m_transport->writeLine(serial::tagCommand(seq, command))) {
            return CommandResult::LinkError;
        }

        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(m_settings.timeout_ms);
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                LOG_DEBUG("SerialArm no reply to '{}'", command);
                return CommandResult::NoReply;
            }

            auto line = m_transport->readLine(static_cast<int>(remaining));
            if (!line) {
                continue;
            }
            LOG_TRACE("SerialArm << {}", *line);

            auto reply = serial::parseReply(*line);
            if (!reply || reply->seq != seq) {
                continue;  // event report or stale reply
            }
            if (payload) {
                *payload = reply->payload;
            }
            if (!reply->ok) {
                if (errorCode) *errorCode = reply->errorCode;
                return CommandResult::Rejected;
            }
            return CommandResult::Ok;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("SerialArm transport exception: {}", e.what());
        return CommandResult::LinkError;
    }
}

SerialArmDriver::StepResult SerialArmDriver::runCommand(const std::string& command,
                                                        double settleSeconds,
                                                        uint64_t generation) {
    int errorCode = 0;
    switch (sendCommand(command, nullptr, &errorCode)) {
        case CommandResult::Ok:
            break;
        case CommandResult::NoReply:
            if (m_settings.require_ack) {
                m_state.fail("No reply to '" + command + "'");
                return StepResult::Failed;
            }
            break;
        case CommandResult::Rejected:
            m_state.fail(fmt::format("Arm rejected '{}' with E{}", command, errorCode));
            return StepResult::Failed;
        case CommandResult::LinkError:
            m_state.fail("Serial link failure on '" + command + "': " + m_transport->lastError());
            return StepResult::Failed;
    }

    if (!m_state.interrupt().waitFor(m_settings.command_delay + settleSeconds, generation)) {
        LOG_WARN("SerialArm '{}' interrupted", command);
        return StepResult::Interrupted;
    }
    return StepResult::Done;
}

SerialArmDriver::StepResult SerialArmDriver::doMove(const Position& target, double speed,
                                                    uint64_t generation, double settleSeconds) {
    const double feed = serial::feedRateForSpeed(speed, m_settings.max_feed_rate);
    StepResult r = runCommand(serial::formatMove(target, feed), settleSeconds, generation);
    if (r == StepResult::Failed) {
        return r;
    }

    {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_position = target;
        m_positionMeasured = false;
    }
    // After an interrupted move the readback is the only trustworthy position
    refreshPosition();
    return r;
}

SerialArmDriver::StepResult SerialArmDriver::doGrab(const GrabParameters& params,
                                                    uint64_t generation) {
    const double timeout = std::max(params.timeout, 0.0);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeout);

    StepResult r = runCommand(serial::formatEffector(m_settings.end_effector, true),
                              std::min(m_settings.grab_settle, timeout), generation);
    if (r != StepResult::Done) {
        return r;
    }

    if (!m_settings.verify_grab) {
        if (m_settings.grab_settle > timeout) {
            switchEffectorOff();
            m_state.fail(fmt::format("Grab timed out after {:.2f}s", timeout));
            return StepResult::Failed;
        }
    } else {
        const char* query = m_settings.end_effector == serial::EndEffector::Pump
            ? serial::CMD_QUERY_PUMP : serial::CMD_QUERY_GRIPPER;
        while (true) {
            std::string payload;
            if (sendCommand(query, &payload) != CommandResult::Ok) {
                LOG_DEBUG("SerialArm grab not verified (no effector status)");
                break;
            }
            auto state = serial::parseValue(payload);
            if (!state) {
                LOG_DEBUG("SerialArm grab not verified (unparsable status '{}')", payload);
                break;
            }
            if (*state == static_cast<int>(serial::EffectorState::Holding)) {
                break;
            }
            if (*state == static_cast<int>(serial::EffectorState::Off)) {
                switchEffectorOff();
                m_state.fail("Grab failed: end effector did not engage");
                return StepResult::Failed;
            }

            // Working: still waiting for the object to take hold
            double remaining = std::chrono::duration<double>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0.0) {
                switchEffectorOff();
                m_state.fail(fmt::format("Grab timed out after {:.2f}s: no object detected", timeout));
                return StepResult::Failed;
            }
            if (!m_state.interrupt().waitFor(std::min(m_settings.grab_poll_interval, remaining),
                                             generation)) {
                return StepResult::Interrupted;
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_holding = true;
    return StepResult::Done;
}

void SerialArmDriver::switchEffectorOff() {
    if (sendCommand(serial::formatEffector(m_settings.end_effector, false)) == CommandResult::LinkError) {
        LOG_WARN("SerialArm could not switch off the end effector");
    }
}

SerialArmDriver::StepResult SerialArmDriver::doRelease(uint64_t generation) {
    StepResult r = runCommand(serial::formatEffector(m_settings.end_effector, false),
                              m_settings.release_settle, generation);
    if (r == StepResult::Done) {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_holding = false;
    }
    return r;
}

void SerialArmDriver::refreshPosition() {
    std::string payload;
    if (sendCommand(serial::CMD_QUERY_POSITION, &payload) != CommandResult::Ok) {
        return;
    }
    auto measured = serial::parsePosition(payload);
    if (!measured) {
        LOG_DEBUG("SerialArm unparsable position reply '{}'", payload);
        return;
    }
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_position = *measured;
    m_positionMeasured = true;
}

void SerialArmDriver::refreshJoints() {
    std::string payload;
    if (sendCommand(serial::CMD_QUERY_ANGLES, &payload) != CommandResult::Ok) {
        return;
    }
    if (auto angles = serial::parseAngles(payload)) {
        std::lock_guard<std::mutex> lock(m_dataMutex);
        m_joints = *angles;
    }
}

} // namespace arm
} // namespace sorting_arm
