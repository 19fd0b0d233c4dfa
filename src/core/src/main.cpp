/**
 * @file main.cpp
 * @brief Sorting Arm Core - Entry Point
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <thread>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "controller/ArmController.hpp"
#include "geometry/CoordinateTransform.hpp"
#include "sorting/SortingOrchestrator.hpp"
#include "vision/FrameGrabber.hpp"
#include "vision/ScriptedDetector.hpp"

using namespace sorting_arm;
using namespace sorting_arm::config;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    // Setup signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_dir = "config";
    if (argc > 1) {
        config_dir = argv[1];
    }

    // Initialize logging (basic setup, will reconfigure after loading config)
    Logger::init("logs/sorting_arm.log", "debug");

    LOG_INFO("========================================");
    LOG_INFO("Sorting Arm Core v1.0.0");
    LOG_INFO("========================================");
    LOG_INFO("Config directory: {}", config_dir);

    ConfigManager config;
    if (!config.loadAll(config_dir)) {
        LOG_ERROR("Failed to load configuration files");
        LOG_ERROR("Make sure system_config.yaml and sorting_config.yaml exist in: {}", config_dir);
        return 1;
    }

    const SystemConfig system = config.systemConfig();
    const SortingConfig sortingConfig = config.sortingConfig();

    // Reconfigure logger based on loaded config
    Logger::reset();
    Logger::init(system.logging.file,
                 system.logging.level,
                 static_cast<size_t>(system.logging.max_size_mb) * 1024 * 1024,
                 static_cast<size_t>(system.logging.max_files),
                 system.logging.console_enabled);

    LOG_INFO("Configuration loaded successfully");

    // Image -> arm mapping
    std::unique_ptr<geometry::CoordinateTransform> transform;
    try {
        transform = std::make_unique<geometry::CoordinateTransform>(sortingConfig.calibration, sortingConfig.transform);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Calibration rejected: {}", e.what());
        return 1;
    }

    // Arm
    std::unique_ptr<controller::ArmController> armController;
    try {
        armController = std::make_unique<controller::ArmController>(sortingConfig.arm.type, sortingConfig.arm.driverConfig());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Cannot create arm driver: {}", e.what());
        return 1;
    }

    controller::ArmSession session(*armController);
    if (!session.connected()) {
        LOG_ERROR("Failed to connect to arm '{}'", sortingConfig.arm.type);
        return 1;
    }
    if (!armController->home()) {
        LOG_WARN("Initial homing failed, continuing");
    }

    // Vision
    auto camera = vision::createCamera(system.camera.type);
    if (!camera) {
        return 1;
    }
    vision::FrameGrabber grabber(std::move(camera));
    if (!grabber.start(system.camera)) {
        LOG_ERROR("Failed to start camera '{}'", system.camera.type);
        return 1;
    }

    vision::ScriptedDetector detector(sortingConfig.scenes);
    sorting::SortingOrchestrator orchestrator(*armController, *transform, sortingConfig.orchestrator);

    LOG_INFO("Arm '{}' ready, detector '{}', press Ctrl+C to exit", armController->armType(), detector.name());

    // Main loop
    const auto cycle = std::chrono::milliseconds(system.control.cycle_time_ms);
    const auto statusInterval = std::chrono::duration<double>(system.control.status_log_interval_s);
    const auto resetDelay = std::chrono::duration<double>(sortingConfig.arm.auto_reset_delay_s);
    auto lastStatus = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> errorSince;

    while (g_running) {
        auto cycleStart = std::chrono::steady_clock::now();

        if (armController->status() == arm::ArmStatus::Error) {
            if (!errorSince) {
                errorSince = cycleStart;
                LOG_WARN("Arm in error state");
            } else if (sortingConfig.arm.auto_reset_errors && cycleStart - *errorSince >= resetDelay) {
                if (armController->resetErrors()) {
                    LOG_INFO("Arm errors cleared");
                    orchestrator.reset();
                }
                errorSince.reset();
            }
        } else {
            errorSince.reset();
        }

        auto frame = grabber.waitFrame(system.control.frame_timeout_ms);
        if (frame) {
            auto result = orchestrator.processDetections(detector.detect(*frame));
            if (result.outcome == sorting::CycleOutcome::Triggered ||
                result.outcome == sorting::CycleOutcome::SortFailed) {
                LOG_INFO("Cycle outcome {} for '{}'", sorting::toString(result.outcome),
                         result.detection ? result.detection->class_name : "");
            }
        } else if (grabber.isRunning()) {
            LOG_WARN("No frame within {} ms", system.control.frame_timeout_ms);
        }

        if (cycleStart - lastStatus >= statusInterval) {
            auto c = orchestrator.counters();
            auto stats = armController->getStatistics();
            LOG_INFO("Status: arm {}, cycles {}, sorts {}/{} ok, busy rejects {}, frames dropped {}",
                     arm::toString(armController->status()), c.cycles, c.sorts_succeeded, c.sorts_triggered,
                     c.rejected_busy, grabber.framesDropped());
            LOG_DEBUG("Arm statistics: {}", stats.toJson().dump());
            lastStatus = cycleStart;
        }

        std::this_thread::sleep_until(cycleStart + cycle);
    }

    // Shutdown
    LOG_INFO("Shutting down...");
    grabber.stop();
    if (armController->status() != arm::ArmStatus::Idle && armController->isConnected()) {
        armController->emergencyStop();
    }

    LOG_INFO("Sorting Arm Core stopped");
    return 0;
}
