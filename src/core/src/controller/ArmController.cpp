/**
 * @file ArmController.cpp
 * @brief Arm controller facade implementation
 */

#include "ArmController.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>

namespace sorting_arm {
namespace controller {

using namespace arm;

ArmController::ArmController(const std::string& type, const nlohmann::json& config,
                             ArmDriverRegistry registry)
    : m_registry(std::move(registry))
{
    // Unknown tags throw std::invalid_argument straight to the caller
    m_driver = std::shared_ptr<IArmDriver>(m_registry.create(type, config));
    if (!m_driver) {
        throw std::invalid_argument("Driver factory for '" + type + "' returned no driver");
    }
    m_type = type;
    LOG_INFO("ArmController created with {} driver ({})", type, m_driver->getDriverName());
}

ArmController::~ArmController() {
    auto active = driver();
    if (active && active->isConnected()) {
        active->disconnect();
    }
}

std::shared_ptr<IArmDriver> ArmController::driver() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_driver;
}

// ============================================================================
// Driver management
// ============================================================================

std::string ArmController::armType() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_type;
}

bool ArmController::hasDriver() const {
    return driver() != nullptr;
}

bool ArmController::switchArmType(const std::string& type, const nlohmann::json& config) {
    std::lock_guard<std::mutex> switchLock(m_switchMutex);
    LOG_INFO("Switching arm type: {} -> {}", armType(), type);

    auto old = driver();
    bool oldWasConnected = old && old->isConnected();
    if (oldWasConnected && !old->disconnect()) {
        LOG_WARN("Old driver did not disconnect cleanly, continuing");
    }

    std::shared_ptr<IArmDriver> candidate;
    try {
        candidate = std::shared_ptr<IArmDriver>(m_registry.create(type, config));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Arm type switch failed: {}", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Arm type switch failed: cannot build '{}' driver: {}", type, e.what());
    }

    if (candidate && candidate->connect()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_driver = candidate;
        m_type = type;
        LOG_INFO("Switched to {} driver", type);
        return true;
    }

    if (candidate) {
        LOG_ERROR("New '{}' driver failed to connect", type);
    }

    // Fall back to the previous driver if it is still usable
    if (old && (!oldWasConnected || old->connect())) {
        LOG_WARN("Keeping previous {} driver", armType());
        return false;
    }

    LOG_ERROR("Previous driver could not reconnect, no arm driver active");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_driver.reset();
    m_type.clear();
    return false;
}

bool ArmController::supportsCompositeSort() const {
    return dynamic_cast<ICompositeSortCapable*>(driver().get()) != nullptr;
}

bool ArmController::supportsStatistics() const {
    return dynamic_cast<ISortingStatistics*>(driver().get()) != nullptr;
}

// ============================================================================
// Forwarded operations
// ============================================================================

bool ArmController::connect() {
    auto d = driver();
    if (!d) {
        LOG_WARN("connect: no arm driver active");
        return false;
    }
    return d->connect();
}

bool ArmController::disconnect() {
    auto d = driver();
    return d ? d->disconnect() : true;
}

bool ArmController::isConnected() const {
    auto d = driver();
    return d && d->isConnected();
}

bool ArmController::home() {
    auto d = driver();
    return d && d->home();
}

bool ArmController::emergencyStop() {
    auto d = driver();
    return d ? d->emergencyStop() : true;
}

bool ArmController::resetErrors() {
    auto d = driver();
    return d && d->resetErrors();
}

ArmStatusReport ArmController::getStatus() const {
    auto d = driver();
    if (!d) {
        ArmStatusReport report;
        report.driver_name = "none";
        report.errors.push_back("No arm driver active");
        return report;
    }
    return d->getStatus();
}

ArmStatus ArmController::status() const {
    return getStatus().status;
}

std::optional<ArmConfiguration> ArmController::getConfiguration() const {
    auto d = driver();
    if (!d) {
        return std::nullopt;
    }
    return d->getConfiguration();
}

bool ArmController::moveToPosition(const Position& target, std::optional<double> speed) {
    auto d = driver();
    return d && d->moveToPosition(target, speed);
}

bool ArmController::moveToJoints(const JointAngles& joints, std::optional<double> speed) {
    auto d = driver();
    return d && d->moveToJoints(joints, speed);
}

bool ArmController::setSpeed(double speed) {
    auto d = driver();
    return d && d->setSpeed(speed);
}

bool ArmController::calibrate() {
    auto d = driver();
    return d && d->calibrate();
}

bool ArmController::grabObject(const GrabParameters& params) {
    auto d = driver();
    return d && d->grabObject(params);
}

bool ArmController::grabObject(const SmartGrabRequest& request) {
    if (request.position) {
        LOG_INFO("Smart grab: '{}' (confidence {:.2f}) at ({:.1f}, {:.1f})",
                 request.category, request.confidence, request.position->x, request.position->y);
    } else {
        LOG_INFO("Smart grab: '{}' (confidence {:.2f})", request.category, request.confidence);
    }
    return sortGarbage(request.category, request.position);
}

bool ArmController::releaseObject() {
    auto d = driver();
    return d && d->releaseObject();
}

bool ArmController::sortGarbage(const std::string& category, std::optional<Position> pickup) {
    auto d = driver();
    auto* sorter = dynamic_cast<ICompositeSortCapable*>(d.get());
    if (!sorter) {
        LOG_WARN("sortGarbage: {} driver has no composite sort", d ? d->getDriverName() : "no");
        return false;
    }
    return sorter->sort(category, pickup);
}

// ============================================================================
// Optional capabilities
// ============================================================================

SortingStatistics ArmController::getStatistics() const {
    auto d = driver();
    if (auto* stats = dynamic_cast<ISortingStatistics*>(d.get())) {
        return stats->getStatistics();
    }
    return SortingStatistics{};
}

std::vector<OperationRecord> ArmController::getOperationHistory(size_t limit) const {
    auto d = driver();
    if (auto* stats = dynamic_cast<ISortingStatistics*>(d.get())) {
        return stats->getOperationHistory(limit);
    }
    return {};
}

bool ArmController::resetStatistics() {
    auto d = driver();
    if (auto* stats = dynamic_cast<ISortingStatistics*>(d.get())) {
        return stats->resetStatistics();
    }
    return false;
}

std::vector<BinInfo> ArmController::getBinsInfo() const {
    auto d = driver();
    if (auto* sorter = dynamic_cast<ICompositeSortCapable*>(d.get())) {
        return sorter->getBins();
    }
    return {};
}

nlohmann::json ArmController::statusJson() const {
    nlohmann::json j = getStatus().toJson();
    j["arm_type"] = armType();
    if (auto config = getConfiguration()) {
        j["configuration"] = config->toJson();
    }
    j["capabilities"] = {
        {"composite_sort", supportsCompositeSort()},
        {"statistics", supportsStatistics()}
    };
    return j;
}

} // namespace controller
} // namespace sorting_arm
