/**
 * @file SortingOrchestrator.hpp
 * @brief Turns a stream of detections into debounced sort requests
 *
 * Per cycle: pick one detection, map its bbox centroid through the
 * transform, and count consecutive sightings at the same arm position.
 * When the count reaches the threshold one smart grab is issued and
 * the count restarts.
 */

#pragma once

#include "../controller/ArmController.hpp"
#include "../geometry/CoordinateTransform.hpp"
#include "../vision/VisionTypes.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace sorting_arm {
namespace sorting {

enum class SelectionPolicy : uint8_t {
    HighestConfidence = 0,
    FirstInFrame
};

struct OrchestratorSettings {
    int stable_threshold = 15;          // consecutive stable readings before a sort
    double position_tolerance = 1.0;    // mm, applied to |dx| and |dy| separately
    double min_confidence = 0.0;
    SelectionPolicy policy = SelectionPolicy::HighestConfidence;
};

enum class CycleOutcome : uint8_t {
    NoDetection = 0,
    OutOfWorkspace,
    Accumulating,
    Triggered,          // sort issued and succeeded
    SortFailed,         // sort issued, driver reported failure
    RejectedBusy        // threshold reached but the arm was not Idle
};

const char* toString(CycleOutcome outcome);

struct CycleResult {
    CycleOutcome outcome = CycleOutcome::NoDetection;
    std::optional<vision::Detection> detection;
    std::optional<arm::Position> target;
    int stable_count = 0;
};

struct OrchestratorCounters {
    uint64_t cycles = 0;
    uint64_t no_detection = 0;
    uint64_t out_of_workspace = 0;
    uint64_t sorts_triggered = 0;
    uint64_t sorts_succeeded = 0;
    uint64_t sorts_failed = 0;
    uint64_t rejected_busy = 0;
};

class SortingOrchestrator {
public:
    SortingOrchestrator(controller::ArmController& arm,
                        geometry::CoordinateTransform& transform,
                        OrchestratorSettings settings = OrchestratorSettings{});

    /**
     * Run one detection cycle. Blocks for the duration of a sort when
     * one is triggered.
     */
    CycleResult processDetections(const std::vector<vision::Detection>& detections);

    /**
     * Recalibrate the transform. Refused while the arm is moving.
     */
    bool updateCalibration(const std::vector<geometry::Point2D>& imagePoints,
                           const std::vector<geometry::Point2D>& robotPoints);

    /// Forget the stability history
    void reset();

    int stableCount() const;
    OrchestratorCounters counters() const;
    const OrchestratorSettings& settings() const { return m_settings; }

    static std::optional<vision::Detection> selectDetection(
        const std::vector<vision::Detection>& detections,
        SelectionPolicy policy, double minConfidence);

private:
    controller::ArmController& m_arm;
    geometry::CoordinateTransform& m_transform;
    OrchestratorSettings m_settings;

    mutable std::mutex m_mutex;
    int m_stableCount = 0;
    std::optional<arm::Position> m_lastTarget;
    OrchestratorCounters m_counters;
};

} // namespace sorting
} // namespace sorting_arm
