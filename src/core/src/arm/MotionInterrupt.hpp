/**
 * @file MotionInterrupt.hpp
 * @brief Interruptible waits for blocking motion calls
 *
 * A motion captures generation() as it claims the arm (see
 * ArmStateMachine::beginCommand), then sleeps through waitFor(). trigger() (emergency stop, disconnect) bumps the
 * generation and wakes every sleeper, which then sees a stale generation.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sorting_arm {
namespace arm {

class MotionInterrupt {
public:
    uint64_t generation() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_generation;
    }

    void trigger() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_generation;
        }
        m_cv.notify_all();
    }

    /**
     * Sleep for @p seconds unless interrupted.
     * @param completedFraction receives elapsed / seconds (1.0 when not interrupted)
     * @return false if interrupted, including before the call
     */
    bool waitFor(double seconds, uint64_t generation, double* completedFraction = nullptr) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_generation != generation) {
            if (completedFraction) *completedFraction = 0.0;
            return false;
        }
        if (seconds <= 0.0) {
            if (completedFraction) *completedFraction = 1.0;
            return true;
        }

        const auto begin = std::chrono::steady_clock::now();
        bool stopped = m_cv.wait_for(lock, std::chrono::duration<double>(seconds),
            [this, generation]() { return m_generation != generation; });

        if (completedFraction) {
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
            *completedFraction = stopped ? std::clamp(elapsed / seconds, 0.0, 1.0) : 1.0;
        }
        return !stopped;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    uint64_t m_generation = 0;
};

} // namespace arm
} // namespace sorting_arm
