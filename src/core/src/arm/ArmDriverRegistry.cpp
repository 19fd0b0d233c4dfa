/**
 * @file ArmDriverRegistry.cpp
 * @brief Driver registry implementation
 */

#include "ArmDriverRegistry.hpp"
#include "SerialArmDriver.hpp"
#include "SimulatedArmDriver.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sorting_arm {
namespace arm {

ArmDriverRegistry ArmDriverRegistry::withBuiltinDrivers() {
    ArmDriverRegistry registry;

    DriverFactory simulated = [](const nlohmann::json& config) -> std::unique_ptr<IArmDriver> {
        return std::make_unique<SimulatedArmDriver>(config);
    };
    DriverFactory serial = [](const nlohmann::json& config) -> std::unique_ptr<IArmDriver> {
        return std::make_unique<SerialArmDriver>(config);
    };

    registry.registerDriver("simulated", simulated);
    registry.registerDriver("virtual", simulated);
    registry.registerDriver("serial", serial);
    registry.registerDriver("uarm", serial);
    return registry;
}

void ArmDriverRegistry::registerDriver(const std::string& type, DriverFactory factory) {
    m_factories[normalize(type)] = std::move(factory);
}

bool ArmDriverRegistry::contains(const std::string& type) const {
    return m_factories.count(normalize(type)) > 0;
}

std::vector<std::string> ArmDriverRegistry::types() const {
    std::vector<std::string> result;
    for (const auto& entry : m_factories) {
        result.push_back(entry.first);
    }
    return result;
}

std::unique_ptr<IArmDriver> ArmDriverRegistry::create(const std::string& type,
                                                      const nlohmann::json& config) const {
    auto it = m_factories.find(normalize(type));
    if (it == m_factories.end()) {
        std::string known;
        for (const auto& entry : m_factories) {
            known += (known.empty() ? "" : ", ") + entry.first;
        }
        throw std::invalid_argument("Unknown arm type '" + type + "' (known: " + known + ")");
    }
    LOG_DEBUG("Creating arm driver '{}'", it->first);
    return it->second(config);
}

std::string ArmDriverRegistry::normalize(const std::string& type) {
    std::string result = type;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace arm
} // namespace sorting_arm
