/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include "SystemConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace sorting_arm {
namespace config {

/**
 * Convert a YAML tree to JSON. Plain scalars become integers, floats or
 * booleans when they parse as one; quoted scalars stay strings.
 */
nlohmann::json yamlToJson(const YAML::Node& node);

/**
 * Configuration Manager
 *
 * Loads system_config.yaml and sorting_config.yaml. Missing keys keep
 * their defaults. A file that fails to parse leaves the previous values
 * in place and returns false.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load system configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Load sorting configuration from YAML file
     * @param filepath Path to sorting_config.yaml
     * @return true if loaded successfully
     */
    bool loadSortingConfig(const std::string& filepath);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     * @return true if all configs loaded successfully
     */
    bool loadAll(const std::string& config_dir = "config");

    /// Parse from in-memory YAML text
    bool loadSystemConfigFromString(const std::string& yaml);
    bool loadSortingConfigFromString(const std::string& yaml);

    SystemConfig systemConfig() const;
    SortingConfig sortingConfig() const;

    bool isLoaded() const;

    /**
     * Get configuration as JSON (for status output)
     */
    nlohmann::json systemConfigToJson() const;
    nlohmann::json sortingConfigToJson() const;

private:
    bool parseSystem(const YAML::Node& root);
    bool parseSorting(const YAML::Node& root);

    SystemConfig m_system_config;
    SortingConfig m_sorting_config;
    bool m_system_loaded = false;
    bool m_sorting_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace sorting_arm
