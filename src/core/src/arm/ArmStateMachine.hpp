/**
 * @file ArmStateMachine.hpp
 * @brief Uniform status state machine shared by all arm drivers
 *
 * Disconnected -> Idle -> {Moving, Grabbing, Releasing, Homing} -> Idle,
 * any connected state -> Error on failure, Error -> Idle on reset.
 * A command is only accepted in Idle; a composite sequence may step
 * between busy states while it holds the gate.
 *
 * The machine owns the motion interrupt. Emergency stop and disconnect
 * trigger it under the state lock, and a command reads the interrupt
 * generation under the same lock when it claims the gate, so a claim
 * is either interrupted by a stop or starts after it.
 */

#pragma once

#include "ArmTypes.hpp"
#include "MotionInterrupt.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace sorting_arm {
namespace arm {

enum class ArmEvent : uint8_t {
    CONNECTED = 0,
    DISCONNECTED,
    MOVE_START,
    GRAB_START,
    RELEASE_START,
    HOME_START,
    COMMAND_COMPLETE,
    COMMAND_FAILED,
    RESET_REQUEST,
    ESTOP
};

const char* toString(ArmEvent event);

struct ArmTransitionRule {
    ArmStatus fromState;
    ArmEvent event;
    ArmStatus toState;
    std::function<bool()> guard;  // Optional guard condition
};

using ArmStatusCallback = std::function<void(ArmStatus oldStatus, ArmStatus newStatus)>;

class ArmStateMachine {
public:
    static constexpr size_t MAX_ERRORS = 32;

    ArmStateMachine();

    ArmStatus status() const;
    bool isConnected() const;
    bool isIdle() const;
    bool isBusy() const;
    bool inSequence() const;

    /**
     * Apply an event through the transition table.
     * @return false if no rule matches (the state is unchanged)
     */
    bool processEvent(ArmEvent event);

    /**
     * Start a single command: Idle -> busy state for @p startEvent.
     * Rejected (false, logged at debug) when not Idle.
     * @param generation receives the interrupt generation the command waits on
     */
    bool beginCommand(ArmEvent startEvent, uint64_t* generation = nullptr);

    /**
     * Busy -> Idle after a single command, or step inside a sequence.
     */
    void completeCommand();

    /**
     * Claim the gate for a composite operation. Steps inside the
     * sequence use step(); finish with endSequence().
     */
    bool beginSequence(ArmEvent firstEvent, uint64_t* generation = nullptr);
    bool step(ArmEvent nextEvent);
    void endSequence();

    /**
     * Any connected state -> Error, recording @p message.
     */
    void fail(const std::string& message);

    /// Error -> Idle and clear the error list. Idle is accepted as a no-op.
    bool reset();

    /// Any connected state -> Idle. Returns true if the arm is connected or already disconnected.
    bool emergencyStop();

    /// Waits of running commands; triggered by ESTOP and DISCONNECTED
    MotionInterrupt& interrupt() { return m_interrupt; }

    void addError(const std::string& message);
    std::vector<std::string> errors() const;

    void setStatusCallback(ArmStatusCallback callback);

private:
    void initTransitionTable();
    bool processEventLocked(ArmEvent event);
    void transitionLocked(ArmStatus newStatus);
    void addErrorLocked(const std::string& message);

    ArmStatus m_status;
    bool m_sequenceActive;
    std::vector<std::string> m_errors;
    std::vector<ArmTransitionRule> m_transitions;
    ArmStatusCallback m_callback;
    MotionInterrupt m_interrupt;

    mutable std::mutex m_mutex;
};

} // namespace arm
} // namespace sorting_arm
