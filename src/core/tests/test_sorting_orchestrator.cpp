/**
 * @file test_sorting_orchestrator.cpp
 * @brief Detection debounce and sort triggering tests
 */

#include <gtest/gtest.h>
#include "sorting/SortingOrchestrator.hpp"
#include "logging/Logger.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace sorting_arm;
using namespace sorting_arm::sorting;
using json = nlohmann::json;

namespace {

vision::Detection detectionAt(double cx, double cy, const std::string& category = "plastic",
                              double confidence = 0.9) {
    vision::Detection det;
    det.class_name = category;
    det.confidence = confidence;
    det.bbox = vision::BoundingBox{cx - 20.0, cy - 20.0, cx + 20.0, cy + 20.0};
    return det;
}

json instantSimulation() {
    return {{"time_scale", 0.0}, {"seed", 3}, {"grab_success_rate", 1.0}};
}

} // namespace

class SortingOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_sorting_orchestrator.log", "debug");
    }

    std::unique_ptr<controller::ArmController> connectedArm(json config = instantSimulation()) {
        auto robot = std::make_unique<controller::ArmController>("simulated", config);
        EXPECT_TRUE(robot->connect());
        return robot;
    }

    geometry::CoordinateTransform transform;
};

// ============================================================================
// Debounce
// ============================================================================

TEST_F(SortingOrchestratorTest, TriggersExactlyOnceAtThreshold) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);
    std::vector<vision::Detection> frame = {detectionAt(320.0, 240.0)};

    for (int i = 1; i < 15; ++i) {
        auto result = orchestrator.processDetections(frame);
        EXPECT_EQ(result.outcome, CycleOutcome::Accumulating) << "cycle " << i;
        EXPECT_EQ(result.stable_count, i);
    }
    EXPECT_EQ(robot->getStatistics().total_operations, 0u);

    auto fifteenth = orchestrator.processDetections(frame);
    EXPECT_EQ(fifteenth.outcome, CycleOutcome::Triggered);
    ASSERT_TRUE(fifteenth.target.has_value());
    EXPECT_NEAR(fifteenth.target->x, 143.9994, 1e-3);
    EXPECT_NEAR(fifteenth.target->y, -34.8235, 1e-3);
    EXPECT_EQ(orchestrator.stableCount(), 0);
    EXPECT_EQ(robot->getStatistics().successful_operations, 1u);

    // Counting restarts from one
    auto next = orchestrator.processDetections(frame);
    EXPECT_EQ(next.outcome, CycleOutcome::Accumulating);
    EXPECT_EQ(next.stable_count, 1);

    for (int i = 0; i < 13; ++i) {
        orchestrator.processDetections(frame);
    }
    EXPECT_EQ(robot->getStatistics().total_operations, 1u);
    EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::Triggered);
    EXPECT_EQ(robot->getStatistics().total_operations, 2u);

    auto counters = orchestrator.counters();
    EXPECT_EQ(counters.cycles, 30u);
    EXPECT_EQ(counters.sorts_triggered, 2u);
    EXPECT_EQ(counters.sorts_succeeded, 2u);
}

TEST_F(SortingOrchestratorTest, EmptyFrameResetsCount) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);
    std::vector<vision::Detection> frame = {detectionAt(320.0, 240.0)};

    for (int i = 0; i < 10; ++i) {
        orchestrator.processDetections(frame);
    }
    EXPECT_EQ(orchestrator.stableCount(), 10);

    auto empty = orchestrator.processDetections({});
    EXPECT_EQ(empty.outcome, CycleOutcome::NoDetection);
    EXPECT_EQ(orchestrator.stableCount(), 0);

    for (int i = 0; i < 14; ++i) {
        EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::Accumulating);
    }
    EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::Triggered);
}

TEST_F(SortingOrchestratorTest, MovedObjectRestartsCount) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);

    for (int i = 0; i < 10; ++i) {
        orchestrator.processDetections({detectionAt(320.0, 240.0)});
    }
    auto moved = orchestrator.processDetections({detectionAt(360.0, 240.0)});
    EXPECT_EQ(moved.outcome, CycleOutcome::Accumulating);
    EXPECT_EQ(moved.stable_count, 1);
}

TEST_F(SortingOrchestratorTest, SubMillimetreJitterIsStable) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);

    // One pixel is roughly 0.2 mm on the arm plane
    for (int i = 0; i < 14; ++i) {
        double jitter = (i % 2) ? 1.0 : 0.0;
        EXPECT_EQ(orchestrator.processDetections({detectionAt(320.0 + jitter, 240.0)}).outcome,
                  CycleOutcome::Accumulating);
    }
    EXPECT_EQ(orchestrator.processDetections({detectionAt(320.0, 240.0)}).outcome,
              CycleOutcome::Triggered);
}

TEST_F(SortingOrchestratorTest, OutOfWorkspaceResetsCount) {
    auto robot = connectedArm();
    geometry::TransformSettings narrow;
    narrow.workspace = geometry::WorkspaceBounds{140.0, 150.0, -40.0, -30.0};
    geometry::CoordinateTransform narrowTransform(geometry::CalibrationPointSet::defaults(), narrow);
    SortingOrchestrator orchestrator(*robot, narrowTransform);

    for (int i = 0; i < 5; ++i) {
        orchestrator.processDetections({detectionAt(320.0, 240.0)});
    }
    auto outside = orchestrator.processDetections({detectionAt(40.0, 40.0)});
    EXPECT_EQ(outside.outcome, CycleOutcome::OutOfWorkspace);
    EXPECT_FALSE(outside.target.has_value());
    EXPECT_EQ(orchestrator.stableCount(), 0);
    EXPECT_EQ(orchestrator.counters().out_of_workspace, 1u);
}

// ============================================================================
// Arm interaction
// ============================================================================

TEST_F(SortingOrchestratorTest, BusyArmRejectsAndRestartsCount) {
    // Never connected: status is Disconnected, not Idle
    controller::ArmController robot("simulated", instantSimulation());
    SortingOrchestrator orchestrator(robot, transform);
    std::vector<vision::Detection> frame = {detectionAt(320.0, 240.0)};

    for (int i = 0; i < 14; ++i) {
        orchestrator.processDetections(frame);
    }
    auto result = orchestrator.processDetections(frame);
    EXPECT_EQ(result.outcome, CycleOutcome::RejectedBusy);
    EXPECT_EQ(orchestrator.stableCount(), 0);
    EXPECT_EQ(orchestrator.counters().rejected_busy, 1u);
    EXPECT_EQ(orchestrator.counters().sorts_triggered, 0u);
}

TEST_F(SortingOrchestratorTest, FailedSortIsReported) {
    auto config = instantSimulation();
    config["grab_success_rate"] = 0.0;
    auto robot = connectedArm(config);
    SortingOrchestrator orchestrator(*robot, transform);
    std::vector<vision::Detection> frame = {detectionAt(320.0, 240.0)};

    for (int i = 0; i < 14; ++i) {
        orchestrator.processDetections(frame);
    }
    EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::SortFailed);
    EXPECT_EQ(robot->status(), arm::ArmStatus::Error);

    // Arm stays in error until reset
    for (int i = 0; i < 14; ++i) {
        orchestrator.processDetections(frame);
    }
    EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::RejectedBusy);

    EXPECT_TRUE(robot->resetErrors());
    EXPECT_EQ(orchestrator.counters().sorts_failed, 1u);
}

TEST_F(SortingOrchestratorTest, UnknownCategoryFailsWithoutError) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);
    std::vector<vision::Detection> frame = {detectionAt(320.0, 240.0, "glass")};

    for (int i = 0; i < 14; ++i) {
        orchestrator.processDetections(frame);
    }
    EXPECT_EQ(orchestrator.processDetections(frame).outcome, CycleOutcome::SortFailed);
    EXPECT_EQ(robot->status(), arm::ArmStatus::Idle);
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(SortingOrchestratorTest, SelectionPolicies) {
    std::vector<vision::Detection> dets = {
        detectionAt(100.0, 100.0, "chips", 0.4),
        detectionAt(200.0, 200.0, "plastic", 0.95),
        detectionAt(300.0, 300.0, "banana", 0.7)
    };

    auto best = SortingOrchestrator::selectDetection(dets, SelectionPolicy::HighestConfidence, 0.0);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->class_name, "plastic");

    auto first = SortingOrchestrator::selectDetection(dets, SelectionPolicy::FirstInFrame, 0.0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->class_name, "chips");

    auto firstConfident = SortingOrchestrator::selectDetection(dets, SelectionPolicy::FirstInFrame, 0.5);
    ASSERT_TRUE(firstConfident.has_value());
    EXPECT_EQ(firstConfident->class_name, "plastic");

    EXPECT_FALSE(SortingOrchestrator::selectDetection(dets, SelectionPolicy::HighestConfidence, 0.99).has_value());
    EXPECT_FALSE(SortingOrchestrator::selectDetection({}, SelectionPolicy::HighestConfidence, 0.0).has_value());
}

TEST_F(SortingOrchestratorTest, LowConfidenceCountsAsNoDetection) {
    auto robot = connectedArm();
    OrchestratorSettings settings;
    settings.min_confidence = 0.5;
    SortingOrchestrator orchestrator(*robot, transform, settings);

    orchestrator.processDetections({detectionAt(320.0, 240.0)});
    auto result = orchestrator.processDetections({detectionAt(320.0, 240.0, "plastic", 0.3)});
    EXPECT_EQ(result.outcome, CycleOutcome::NoDetection);
    EXPECT_EQ(orchestrator.stableCount(), 0);
}

TEST_F(SortingOrchestratorTest, CustomThreshold) {
    auto robot = connectedArm();
    OrchestratorSettings settings;
    settings.stable_threshold = 3;
    SortingOrchestrator orchestrator(*robot, transform, settings);

    orchestrator.processDetections({detectionAt(320.0, 240.0)});
    orchestrator.processDetections({detectionAt(320.0, 240.0)});
    EXPECT_EQ(orchestrator.processDetections({detectionAt(320.0, 240.0)}).outcome,
              CycleOutcome::Triggered);
}

// ============================================================================
// Recalibration
// ============================================================================

TEST_F(SortingOrchestratorTest, RecalibrationResetsCount) {
    auto robot = connectedArm();
    SortingOrchestrator orchestrator(*robot, transform);

    for (int i = 0; i < 5; ++i) {
        orchestrator.processDetections({detectionAt(320.0, 240.0)});
    }

    auto points = geometry::CalibrationPointSet::defaults();
    std::vector<geometry::Point2D> quarter;
    for (const auto& p : points.image_points) {
        quarter.emplace_back(p.x * 0.25, p.y * 0.25);
    }
    EXPECT_TRUE(orchestrator.updateCalibration(points.image_points, quarter));
    EXPECT_EQ(orchestrator.stableCount(), 0);

    auto result = orchestrator.processDetections({detectionAt(320.0, 240.0)});
    ASSERT_TRUE(result.target.has_value());
    EXPECT_NEAR(result.target->x, 80.0, 1e-6);
    EXPECT_NEAR(result.target->y, 60.0, 1e-6);

    EXPECT_FALSE(orchestrator.updateCalibration(points.image_points, {}));
}

TEST_F(SortingOrchestratorTest, RecalibrationRefusedWhileMoving) {
    auto config = instantSimulation();
    config["time_scale"] = 1.0;
    config["connect_time"] = 0.0;
    auto robot = connectedArm(config);
    SortingOrchestrator orchestrator(*robot, transform);

    auto motion = std::async(std::launch::async, [&]() {
        return robot->moveToPosition(arm::Position(400.0, 0.0, 200.0));
    });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (robot->status() != arm::ArmStatus::Moving && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(robot->status(), arm::ArmStatus::Moving);

    auto points = geometry::CalibrationPointSet::defaults();
    EXPECT_FALSE(orchestrator.updateCalibration(points.image_points, points.robot_points));

    EXPECT_TRUE(robot->emergencyStop());
    EXPECT_FALSE(motion.get());
    EXPECT_TRUE(orchestrator.updateCalibration(points.image_points, points.robot_points));
}
