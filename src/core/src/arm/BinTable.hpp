/**
 * @file BinTable.hpp
 * @brief Category -> bin mapping, read-only after construction
 */

#pragma once

#include "ArmTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sorting_arm {
namespace arm {

class BinTable {
public:
    BinTable() = default;
    explicit BinTable(std::vector<BinInfo> bins);

    /**
     * Build from a configuration dictionary:
     *   { "plastic": {"id": 1, "name": "...", "color": "#...", "position": [x, y, z]}, ... }
     * Entries with a missing or invalid position are skipped with a warning.
     * An empty or non-object dictionary yields @p fallback.
     */
    static BinTable fromJson(const nlohmann::json& j, const BinTable& fallback);

    std::optional<BinInfo> find(const std::string& category) const;
    bool contains(const std::string& category) const { return find(category).has_value(); }

    const std::vector<BinInfo>& bins() const { return m_bins; }
    size_t size() const { return m_bins.size(); }
    bool empty() const { return m_bins.empty(); }

private:
    std::vector<BinInfo> m_bins;
};

/// Nine-category table for the simulated 6-DOF arm (mm)
BinTable defaultSimulatedBins();

/// Same categories laid out within the reach of a small desktop arm (mm)
BinTable defaultDesktopArmBins();

} // namespace arm
} // namespace sorting_arm
