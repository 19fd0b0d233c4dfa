/**
 * @file ArmDriverRegistry.hpp
 * @brief Type tag -> driver factory table
 */

#pragma once

#include "IArmDriver.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sorting_arm {
namespace arm {

using DriverFactory = std::function<std::unique_ptr<IArmDriver>(const nlohmann::json& config)>;

class ArmDriverRegistry {
public:
    /// Empty registry
    ArmDriverRegistry() = default;

    /**
     * Registry with the built-in drivers:
     *   "simulated", "virtual" -> SimulatedArmDriver
     *   "serial", "uarm"       -> SerialArmDriver
     */
    static ArmDriverRegistry withBuiltinDrivers();

    /// Replaces an existing entry with the same tag
    void registerDriver(const std::string& type, DriverFactory factory);

    bool contains(const std::string& type) const;
    std::vector<std::string> types() const;

    /**
     * Build a driver. Tags are matched case-insensitively.
     * @throws std::invalid_argument for an unknown tag
     */
    std::unique_ptr<IArmDriver> create(const std::string& type, const nlohmann::json& config) const;

private:
    static std::string normalize(const std::string& type);

    std::map<std::string, DriverFactory> m_factories;
};

} // namespace arm
} // namespace sorting_arm
