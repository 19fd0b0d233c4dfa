/**
 * @file SortingOrchestrator.cpp
 * @brief Detection debounce and sort triggering
 */

#include "SortingOrchestrator.hpp"
#include "../logging/Logger.hpp"
#include <cmath>

namespace sorting_arm {
namespace sorting {

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::NoDetection:    return "NO_DETECTION";
        case CycleOutcome::OutOfWorkspace: return "OUT_OF_WORKSPACE";
        case CycleOutcome::Accumulating:   return "ACCUMULATING";
        case CycleOutcome::Triggered:      return "TRIGGERED";
        case CycleOutcome::SortFailed:     return "SORT_FAILED";
        case CycleOutcome::RejectedBusy:   return "REJECTED_BUSY";
        default:                           return "UNKNOWN";
    }
}

SortingOrchestrator::SortingOrchestrator(controller::ArmController& arm,
                                         geometry::CoordinateTransform& transform,
                                         OrchestratorSettings settings)
    : m_arm(arm)
    , m_transform(transform)
    , m_settings(settings)
{
    if (m_settings.stable_threshold < 1) {
        LOG_WARN("Stable threshold {} raised to 1", m_settings.stable_threshold);
        m_settings.stable_threshold = 1;
    }
    LOG_INFO("SortingOrchestrator: threshold {}, tolerance {:.2f} mm, min confidence {:.2f}",
             m_settings.stable_threshold, m_settings.position_tolerance, m_settings.min_confidence);
}

std::optional<vision::Detection> SortingOrchestrator::selectDetection(
    const std::vector<vision::Detection>& detections,
    SelectionPolicy policy, double minConfidence) {

    std::optional<vision::Detection> best;
    for (const auto& det : detections) {
        if (det.confidence < minConfidence) {
            continue;
        }
        if (policy == SelectionPolicy::FirstInFrame) {
            return det;
        }
        if (!best || det.confidence > best->confidence) {
            best = det;
        }
    }
    return best;
}

CycleResult SortingOrchestrator::processDetections(const std::vector<vision::Detection>& detections) {
    CycleResult result;
    result.detection = selectDetection(detections, m_settings.policy, m_settings.min_confidence);

    std::unique_lock<std::mutex> lock(m_mutex);
    ++m_counters.cycles;

    if (!result.detection) {
        m_stableCount = 0;
        ++m_counters.no_detection;
        result.outcome = CycleOutcome::NoDetection;
        return result;
    }

    const auto& bbox = result.detection->bbox;
    result.target = m_transform.safeConvert(bbox.centerX(), bbox.centerY());
    if (!result.target) {
        m_stableCount = 0;
        ++m_counters.out_of_workspace;
        result.outcome = CycleOutcome::OutOfWorkspace;
        LOG_DEBUG("'{}' at pixel ({:.0f}, {:.0f}) is outside the workspace",
                  result.detection->class_name, bbox.centerX(), bbox.centerY());
        return result;
    }

    const arm::Position& current = *result.target;
    bool stable = m_lastTarget &&
        std::abs(current.x - m_lastTarget->x) <= m_settings.position_tolerance &&
        std::abs(current.y - m_lastTarget->y) <= m_settings.position_tolerance;

    m_stableCount = (m_stableCount > 0 && stable) ? m_stableCount + 1 : 1;
    m_lastTarget = current;

    if (m_stableCount < m_settings.stable_threshold) {
        result.outcome = CycleOutcome::Accumulating;
        result.stable_count = m_stableCount;
        return result;
    }

    // Threshold reached: one request, then start counting again
    result.stable_count = m_stableCount;
    m_stableCount = 0;

    if (m_arm.status() != arm::ArmStatus::Idle) {
        ++m_counters.rejected_busy;
        result.outcome = CycleOutcome::RejectedBusy;
        LOG_INFO("Sort of '{}' skipped: arm is {}", result.detection->class_name,
                 arm::toString(m_arm.status()));
        return result;
    }

    ++m_counters.sorts_triggered;
    lock.unlock();

    LOG_INFO("Stable '{}' ({:.2f}) at ({:.1f}, {:.1f}), sorting",
             result.detection->class_name, result.detection->confidence, current.x, current.y);

    controller::SmartGrabRequest request;
    request.category = result.detection->class_name;
    request.confidence = result.detection->confidence;
    request.position = current;
    request.bbox = bbox;
    bool ok = m_arm.grabObject(request);

    lock.lock();
    if (ok) {
        ++m_counters.sorts_succeeded;
        result.outcome = CycleOutcome::Triggered;
    } else {
        ++m_counters.sorts_failed;
        result.outcome = CycleOutcome::SortFailed;
        LOG_WARN("Sort of '{}' failed, arm is {}", request.category, arm::toString(m_arm.status()));
    }
    return result;
}

bool SortingOrchestrator::updateCalibration(const std::vector<geometry::Point2D>& imagePoints,
                                            const std::vector<geometry::Point2D>& robotPoints) {
    auto status = m_arm.status();
    if (arm::isBusy(status)) {
        LOG_WARN("Recalibration refused while arm is {}", arm::toString(status));
        return false;
    }
    if (!m_transform.updateCalibration(imagePoints, robotPoints)) {
        return false;
    }
    // Old targets were in the previous mapping
    reset();
    return true;
}

void SortingOrchestrator::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stableCount = 0;
    m_lastTarget.reset();
}

int SortingOrchestrator::stableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stableCount;
}

OrchestratorCounters SortingOrchestrator::counters() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_counters;
}

} // namespace sorting
} // namespace sorting_arm
