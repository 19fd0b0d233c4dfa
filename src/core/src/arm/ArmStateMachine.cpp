/**
 * @file ArmStateMachine.cpp
 * @brief Arm status state machine implementation
 */

#include "ArmStateMachine.hpp"
#include "../logging/Logger.hpp"

namespace sorting_arm {
namespace arm {

const char* toString(ArmEvent event) {
    switch (event) {
        case ArmEvent::CONNECTED:        return "CONNECTED";
        case ArmEvent::DISCONNECTED:     return "DISCONNECTED";
        case ArmEvent::MOVE_START:       return "MOVE_START";
        case ArmEvent::GRAB_START:       return "GRAB_START";
        case ArmEvent::RELEASE_START:    return "RELEASE_START";
        case ArmEvent::HOME_START:       return "HOME_START";
        case ArmEvent::COMMAND_COMPLETE: return "COMMAND_COMPLETE";
        case ArmEvent::COMMAND_FAILED:   return "COMMAND_FAILED";
        case ArmEvent::RESET_REQUEST:    return "RESET_REQUEST";
        case ArmEvent::ESTOP:            return "ESTOP";
        default:                         return "UNKNOWN";
    }
}

ArmStateMachine::ArmStateMachine()
    : m_status(ArmStatus::Disconnected)
    , m_sequenceActive(false)
{
    initTransitionTable();
}

void ArmStateMachine::initTransitionTable() {
    const ArmStatus busyStates[] = {
        ArmStatus::Moving, ArmStatus::Grabbing, ArmStatus::Releasing, ArmStatus::Homing
    };
    const std::pair<ArmEvent, ArmStatus> starts[] = {
        {ArmEvent::MOVE_START, ArmStatus::Moving},
        {ArmEvent::GRAB_START, ArmStatus::Grabbing},
        {ArmEvent::RELEASE_START, ArmStatus::Releasing},
        {ArmEvent::HOME_START, ArmStatus::Homing}
    };

    // From DISCONNECTED
    m_transitions.push_back({ArmStatus::Disconnected, ArmEvent::CONNECTED, ArmStatus::Idle, nullptr});

    // From IDLE
    for (const auto& start : starts) {
        m_transitions.push_back({ArmStatus::Idle, start.first, start.second, nullptr});
    }
    m_transitions.push_back({ArmStatus::Idle, ArmEvent::COMMAND_FAILED, ArmStatus::Error, nullptr});

    // Between busy states (composite sequence only), and back to IDLE
    for (ArmStatus busy : busyStates) {
        for (const auto& start : starts) {
            m_transitions.push_back({busy, start.first, start.second,
                [this]() { return m_sequenceActive; }});
        }
        m_transitions.push_back({busy, ArmEvent::COMMAND_COMPLETE, ArmStatus::Idle, nullptr});
        m_transitions.push_back({busy, ArmEvent::COMMAND_FAILED, ArmStatus::Error, nullptr});
    }

    // From ERROR
    m_transitions.push_back({ArmStatus::Error, ArmEvent::RESET_REQUEST, ArmStatus::Idle, nullptr});
    m_transitions.push_back({ArmStatus::Error, ArmEvent::COMMAND_FAILED, ArmStatus::Error, nullptr});

    LOG_TRACE("Arm transition table initialized with {} rules", m_transitions.size());
}

ArmStatus ArmStateMachine::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool ArmStateMachine::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status != ArmStatus::Disconnected;
}

bool ArmStateMachine::isIdle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status == ArmStatus::Idle;
}

bool ArmStateMachine::isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return arm::isBusy(m_status);
}

bool ArmStateMachine::inSequence() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sequenceActive;
}

bool ArmStateMachine::processEvent(ArmEvent event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return processEventLocked(event);
}

bool ArmStateMachine::processEventLocked(ArmEvent event) {
    // E-Stop and disconnect are accepted from every state
    if (event == ArmEvent::DISCONNECTED) {
        m_interrupt.trigger();
        m_sequenceActive = false;
        transitionLocked(ArmStatus::Disconnected);
        return true;
    }
    if (event == ArmEvent::ESTOP) {
        m_interrupt.trigger();
        m_sequenceActive = false;
        if (m_status != ArmStatus::Disconnected) {
            transitionLocked(ArmStatus::Idle);
        }
        return true;
    }

    for (const auto& rule : m_transitions) {
        if (rule.fromState == m_status && rule.event == event) {
            if (rule.guard && !rule.guard()) {
                LOG_DEBUG("Arm transition guard failed for {} in {}",
                          toString(event), toString(m_status));
                return false;
            }
            transitionLocked(rule.toState);
            return true;
        }
    }

    LOG_DEBUG("No arm transition for event {} in state {}", toString(event), toString(m_status));
    return false;
}

void ArmStateMachine::transitionLocked(ArmStatus newStatus) {
    if (newStatus == m_status) {
        return;
    }
    ArmStatus old = m_status;
    m_status = newStatus;
    LOG_DEBUG("Arm status: {} -> {}", toString(old), toString(newStatus));
    if (m_callback) {
        m_callback(old, newStatus);
    }
}

bool ArmStateMachine::beginCommand(ArmEvent startEvent, uint64_t* generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ArmStatus::Idle) {
        LOG_DEBUG("Command {} rejected: arm is {}", toString(startEvent), toString(m_status));
        return false;
    }
    if (!processEventLocked(startEvent)) {
        return false;
    }
    if (generation) {
        *generation = m_interrupt.generation();
    }
    return true;
}

void ArmStateMachine::completeCommand() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // A sequence keeps the gate until endSequence(); an estop may already have left Idle
    if (m_sequenceActive || !arm::isBusy(m_status)) {
        return;
    }
    processEventLocked(ArmEvent::COMMAND_COMPLETE);
}

bool ArmStateMachine::beginSequence(ArmEvent firstEvent, uint64_t* generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != ArmStatus::Idle) {
        LOG_DEBUG("Sequence rejected: arm is {}", toString(m_status));
        return false;
    }
    if (!processEventLocked(firstEvent)) {
        return false;
    }
    m_sequenceActive = true;
    if (generation) {
        *generation = m_interrupt.generation();
    }
    return true;
}

bool ArmStateMachine::step(ArmEvent nextEvent) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sequenceActive) {
        return false;
    }
    if (m_status == ArmStatus::Idle || m_status == ArmStatus::Error ||
        m_status == ArmStatus::Disconnected) {
        // Interrupted (estop, failure, disconnect) while stepping
        return false;
    }
    return processEventLocked(nextEvent);
}

void ArmStateMachine::endSequence() {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool wasActive = m_sequenceActive;
    m_sequenceActive = false;
    if (wasActive && arm::isBusy(m_status)) {
        processEventLocked(ArmEvent::COMMAND_COMPLETE);
    }
}

void ArmStateMachine::fail(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    addErrorLocked(message);
    if (m_status == ArmStatus::Disconnected) {
        return;
    }
    m_sequenceActive = false;
    LOG_ERROR("Arm error: {}", message);
    processEventLocked(ArmEvent::COMMAND_FAILED);
}

bool ArmStateMachine::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status == ArmStatus::Idle) {
        m_errors.clear();
        return true;
    }
    if (!processEventLocked(ArmEvent::RESET_REQUEST)) {
        return false;
    }
    m_errors.clear();
    return true;
}

bool ArmStateMachine::emergencyStop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return processEventLocked(ArmEvent::ESTOP);
}

void ArmStateMachine::addError(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    addErrorLocked(message);
}

void ArmStateMachine::addErrorLocked(const std::string& message) {
    m_errors.push_back(message);
    if (m_errors.size() > MAX_ERRORS) {
        m_errors.erase(m_errors.begin());
    }
}

std::vector<std::string> ArmStateMachine::errors() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

void ArmStateMachine::setStatusCallback(ArmStatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

} // namespace arm
} // namespace sorting_arm
