/**
 * @file test_arm_controller.cpp
 * @brief Arm controller facade, driver registry and session tests
 */

#include <gtest/gtest.h>
#include "controller/ArmController.hpp"
#include "arm/SimulatedArmDriver.hpp"
#include "logging/Logger.hpp"
#include <atomic>

using namespace sorting_arm;
using namespace sorting_arm::arm;
using namespace sorting_arm::controller;
using json = nlohmann::json;

namespace {

/**
 * Driver with only the core interface: no composite sort, no statistics.
 * connect() succeeds @p connectsAllowed times (negative: always).
 */
class BasicArmDriver : public IArmDriver {
public:
    explicit BasicArmDriver(int connectsAllowed = -1, bool connectResult = true)
        : m_connectsAllowed(connectsAllowed), m_connectResult(connectResult) {}

    bool connect() override {
        if (!m_connectResult || m_connectsAllowed == 0) {
            return false;
        }
        if (m_connectsAllowed > 0) {
            --m_connectsAllowed;
        }
        m_state.processEvent(ArmEvent::CONNECTED);
        return true;
    }
    bool disconnect() override {
        m_state.processEvent(ArmEvent::DISCONNECTED);
        return true;
    }
    bool isConnected() const override { return m_state.isConnected(); }
    bool home() override { return moveToPosition(Position(0.0, 0.0, 100.0)); }
    bool emergencyStop() override { return m_state.emergencyStop(); }
    bool resetErrors() override { return m_state.reset(); }

    bool moveToPosition(const Position& target, std::optional<double> = std::nullopt) override {
        if (!m_state.beginCommand(ArmEvent::MOVE_START)) {
            return false;
        }
        m_position = target;
        m_state.completeCommand();
        return true;
    }
    bool moveToJoints(const JointAngles& joints, std::optional<double> = std::nullopt) override {
        if (!m_state.beginCommand(ArmEvent::MOVE_START)) {
            return false;
        }
        m_joints = joints;
        m_state.completeCommand();
        return true;
    }
    std::optional<Position> getCurrentPosition() const override { return m_position; }
    std::optional<JointAngles> getCurrentJoints() const override { return m_joints; }

    bool grabObject(const GrabParameters& = GrabParameters{}) override {
        if (!m_state.beginCommand(ArmEvent::GRAB_START)) {
            return false;
        }
        m_holding = true;
        m_state.completeCommand();
        return true;
    }
    bool releaseObject() override {
        if (!m_state.beginCommand(ArmEvent::RELEASE_START)) {
            return false;
        }
        m_holding = false;
        m_state.completeCommand();
        return true;
    }
    bool isHoldingObject() const override { return m_holding; }

    ArmStatusReport getStatus() const override {
        ArmStatusReport report;
        report.driver_name = getDriverName();
        report.status = m_state.status();
        report.connected = m_state.isConnected();
        report.position = m_position;
        report.holding_object = m_holding;
        return report;
    }
    ArmConfiguration getConfiguration() const override { return ArmConfiguration{}; }
    std::string getDriverName() const override { return "BasicArm"; }

protected:
    bool applySpeed(double) override { return true; }

private:
    int m_connectsAllowed;
    bool m_connectResult;
    ArmStateMachine m_state;
    Position m_position;
    JointAngles m_joints;
    bool m_holding = false;
};

json instantSimulation() {
    return {{"time_scale", 0.0}, {"seed", 1}, {"grab_success_rate", 1.0}};
}

} // namespace

class ArmControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_arm_controller.log", "debug");

        registry = ArmDriverRegistry::withBuiltinDrivers();
        registry.registerDriver("basic", [](const json&) {
            return std::make_unique<BasicArmDriver>();
        });
        registry.registerDriver("broken", [](const json&) {
            return std::make_unique<BasicArmDriver>(-1, false);
        });
        registry.registerDriver("flaky", [](const json&) {
            return std::make_unique<BasicArmDriver>(1);
        });
        registry.registerDriver("throwing", [](const json&) -> std::unique_ptr<IArmDriver> {
            throw std::runtime_error("bad parameters");
        });
    }

    ArmDriverRegistry registry;
};

// ============================================================================
// Registry
// ============================================================================

TEST_F(ArmControllerTest, RegistryTags) {
    auto builtin = ArmDriverRegistry::withBuiltinDrivers();
    EXPECT_TRUE(builtin.contains("simulated"));
    EXPECT_TRUE(builtin.contains("VIRTUAL"));
    EXPECT_TRUE(builtin.contains("serial"));
    EXPECT_TRUE(builtin.contains("uarm"));
    EXPECT_FALSE(builtin.contains("industrial"));
    EXPECT_EQ(builtin.types().size(), 4u);

    EXPECT_THROW(builtin.create("industrial", json::object()), std::invalid_argument);
    auto driver = builtin.create("Virtual", instantSimulation());
    ASSERT_NE(driver, nullptr);
    EXPECT_EQ(driver->getDriverName(), "SimulatedArm");
}

TEST_F(ArmControllerTest, UnknownTypeThrows) {
    EXPECT_THROW(ArmController("industrial", json::object()), std::invalid_argument);
}

// ============================================================================
// Forwarding and capabilities
// ============================================================================

TEST_F(ArmControllerTest, ForwardsToSimulatedDriver) {
    ArmController controller("simulated", instantSimulation(), registry);
    EXPECT_EQ(controller.armType(), "simulated");
    EXPECT_TRUE(controller.hasDriver());
    EXPECT_FALSE(controller.isConnected());
    EXPECT_EQ(controller.status(), ArmStatus::Disconnected);

    ASSERT_TRUE(controller.connect());
    EXPECT_TRUE(controller.moveToPosition(Position(120.0, 30.0, 80.0)));
    EXPECT_EQ(controller.getStatus().position, Position(120.0, 30.0, 80.0));
    EXPECT_TRUE(controller.setSpeed(75.0));
    EXPECT_FALSE(controller.setSpeed(120.0));
    EXPECT_TRUE(controller.calibrate());
    EXPECT_TRUE(controller.home());

    ASSERT_TRUE(controller.getConfiguration().has_value());
    EXPECT_EQ(controller.getConfiguration()->degrees_of_freedom, 6);
}

TEST_F(ArmControllerTest, SimulatedDriverHasCapabilities) {
    ArmController controller("simulated", instantSimulation(), registry);
    EXPECT_TRUE(controller.supportsCompositeSort());
    EXPECT_TRUE(controller.supportsStatistics());
    EXPECT_EQ(controller.getBinsInfo().size(), 9u);
}

TEST_F(ArmControllerTest, MissingCapabilitiesDegrade) {
    ArmController controller("basic", json::object(), registry);
    ASSERT_TRUE(controller.connect());

    EXPECT_FALSE(controller.supportsCompositeSort());
    EXPECT_FALSE(controller.supportsStatistics());
    EXPECT_FALSE(controller.sortGarbage("plastic"));
    EXPECT_EQ(controller.getStatistics().total_operations, 0u);
    EXPECT_TRUE(controller.getOperationHistory().empty());
    EXPECT_FALSE(controller.resetStatistics());
    EXPECT_TRUE(controller.getBinsInfo().empty());

    SmartGrabRequest request;
    request.category = "plastic";
    request.confidence = 0.9;
    request.position = Position(150.0, 0.0, 0.0);
    EXPECT_FALSE(controller.grabObject(request));

    // Core operations still work
    EXPECT_TRUE(controller.grabObject(GrabParameters{}));
    EXPECT_TRUE(controller.getStatus().holding_object);
    EXPECT_TRUE(controller.releaseObject());
    EXPECT_EQ(controller.status(), ArmStatus::Idle);
}

TEST_F(ArmControllerTest, SmartGrabRunsCompositeSort) {
    ArmController controller("simulated", instantSimulation(), registry);
    ASSERT_TRUE(controller.connect());

    SmartGrabRequest request;
    request.category = "plastic";
    request.confidence = 0.93;
    request.position = Position(150.0, -20.0, 0.0);
    request.bbox = vision::BoundingBox{300.0, 220.0, 340.0, 260.0};
    EXPECT_TRUE(controller.grabObject(request));

    auto stats = controller.getStatistics();
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.sorted_per_category["plastic"], 1u);
    ASSERT_EQ(controller.getOperationHistory().size(), 1u);

    EXPECT_TRUE(controller.resetStatistics());
    EXPECT_EQ(controller.getStatistics().total_operations, 0u);
}

TEST_F(ArmControllerTest, StatusJson) {
    ArmController controller("basic", json::object(), registry);
    auto j = controller.statusJson();
    EXPECT_EQ(j["arm_type"], "basic");
    EXPECT_EQ(j["driver"], "BasicArm");
    EXPECT_FALSE(j["capabilities"]["composite_sort"].get<bool>());
    EXPECT_TRUE(j.contains("configuration"));
}

// ============================================================================
// Hot swap
// ============================================================================

TEST_F(ArmControllerTest, SwitchToWorkingDriver) {
    ArmController controller("simulated", instantSimulation(), registry);
    ASSERT_TRUE(controller.connect());

    EXPECT_TRUE(controller.switchArmType("basic", json::object()));
    EXPECT_EQ(controller.armType(), "basic");
    EXPECT_TRUE(controller.isConnected());
    EXPECT_FALSE(controller.supportsCompositeSort());
    EXPECT_EQ(controller.getStatus().driver_name, "BasicArm");
}

TEST_F(ArmControllerTest, SwitchFailureKeepsConnectedOldDriver) {
    ArmController controller("simulated", instantSimulation(), registry);
    ASSERT_TRUE(controller.connect());
    ASSERT_TRUE(controller.moveToPosition(Position(100.0, 0.0, 100.0)));

    EXPECT_FALSE(controller.switchArmType("broken", json::object()));
    EXPECT_EQ(controller.armType(), "simulated");
    EXPECT_TRUE(controller.isConnected());
    EXPECT_TRUE(controller.supportsCompositeSort());

    EXPECT_FALSE(controller.switchArmType("industrial", json::object()));
    EXPECT_FALSE(controller.switchArmType("throwing", json::object()));
    EXPECT_EQ(controller.armType(), "simulated");
    EXPECT_TRUE(controller.isConnected());
}

TEST_F(ArmControllerTest, SwitchToUnreachableSerialPort) {
    ArmController controller("simulated", instantSimulation(), registry);
    ASSERT_TRUE(controller.connect());

    EXPECT_FALSE(controller.switchArmType("serial", {{"port", "/dev/ttyNOSUCHPORT0"},
                                                     {"startup_delay", 0.0}}));
    EXPECT_EQ(controller.armType(), "simulated");
    EXPECT_TRUE(controller.isConnected());
}

TEST_F(ArmControllerTest, SwitchFailureWithoutFallbackLeavesNoDriver) {
    ArmController controller("flaky", json::object(), registry);
    ASSERT_TRUE(controller.connect());

    // The flaky driver cannot connect a second time
    EXPECT_FALSE(controller.switchArmType("broken", json::object()));
    EXPECT_FALSE(controller.hasDriver());
    EXPECT_TRUE(controller.armType().empty());

    auto status = controller.getStatus();
    EXPECT_EQ(status.driver_name, "none");
    EXPECT_EQ(status.status, ArmStatus::Disconnected);
    EXPECT_FALSE(controller.connect());
    EXPECT_FALSE(controller.moveToPosition(Position(1.0, 0.0, 0.0)));
    EXPECT_TRUE(controller.emergencyStop());
    EXPECT_FALSE(controller.getConfiguration().has_value());

    // Recover by switching to a working type
    EXPECT_TRUE(controller.switchArmType("basic", json::object()));
    EXPECT_TRUE(controller.isConnected());
}

// ============================================================================
// Session
// ============================================================================

TEST_F(ArmControllerTest, SessionConnectsAndDisconnects) {
    ArmController controller("simulated", instantSimulation(), registry);
    {
        ArmSession session(controller);
        EXPECT_TRUE(session.connected());
        EXPECT_TRUE(controller.isConnected());
    }
    EXPECT_FALSE(controller.isConnected());
}

TEST_F(ArmControllerTest, SessionReportsFailedConnect) {
    ArmController controller("broken", json::object(), registry);
    ArmSession session(controller);
    EXPECT_FALSE(session.connected());
    EXPECT_FALSE(controller.isConnected());
}
