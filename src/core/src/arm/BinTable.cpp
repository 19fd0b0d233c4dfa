/**
 * @file BinTable.cpp
 * @brief Bin table construction and default layouts
 */

#include "BinTable.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>

namespace sorting_arm {
namespace arm {

BinTable::BinTable(std::vector<BinInfo> bins)
    : m_bins(std::move(bins)) {
    std::sort(m_bins.begin(), m_bins.end(),
              [](const BinInfo& a, const BinInfo& b) { return a.id < b.id; });
}

BinTable BinTable::fromJson(const nlohmann::json& j, const BinTable& fallback) {
    if (!j.is_object() || j.empty()) {
        return fallback;
    }

    std::vector<BinInfo> bins;
    int nextId = 1;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& entry = it.value();
        BinInfo bin;
        bin.category = it.key();

        std::optional<Position> pos;
        if (entry.is_object() && entry.contains("position")) {
            pos = positionFromJson(entry["position"]);
        } else {
            pos = positionFromJson(entry);
        }
        if (!pos) {
            LOG_WARN("Bin '{}' has no valid position, skipped", bin.category);
            continue;
        }
        bin.position = *pos;

        if (entry.is_object()) {
            bin.id = entry.value("id", nextId);
            bin.name = entry.value("name", bin.category);
            bin.color = entry.value("color", std::string("#9CA3AF"));
        } else {
            bin.id = nextId;
            bin.name = bin.category;
            bin.color = "#9CA3AF";
        }
        nextId = std::max(nextId, bin.id) + 1;
        bins.push_back(bin);
    }

    if (bins.empty()) {
        LOG_WARN("No usable bins in configuration, using defaults");
        return fallback;
    }
    return BinTable(std::move(bins));
}

std::optional<BinInfo> BinTable::find(const std::string& category) const {
    for (const auto& bin : m_bins) {
        if (bin.category == category) {
            return bin;
        }
    }
    return std::nullopt;
}

BinTable defaultSimulatedBins() {
    return BinTable({
        {1, "plastic",         "Plastic Bin",         "#3B82F6", Position(600.0, 200.0, 50.0)},
        {2, "banana",          "Organic Waste Bin",   "#EAB308", Position(600.0, 100.0, 50.0)},
        {3, "beverages",       "Beverage Bin",        "#10B981", Position(600.0, 0.0, 50.0)},
        {4, "cardboard_box",   "Cardboard Bin",       "#F59E0B", Position(600.0, -100.0, 50.0)},
        {5, "chips",           "Snack Packaging Bin", "#EF4444", Position(600.0, -200.0, 50.0)},
        {6, "fish_bones",      "Food Waste Bin",      "#8B5CF6", Position(500.0, 200.0, 50.0)},
        {7, "instant_noodles", "Noodle Packaging Bin","#F97316", Position(500.0, 100.0, 50.0)},
        {8, "milk_box_type1",  "Milk Carton Bin 1",   "#06B6D4", Position(500.0, 0.0, 50.0)},
        {9, "milk_box_type2",  "Milk Carton Bin 2",   "#84CC16", Position(500.0, -100.0, 50.0)}
    });
}

BinTable defaultDesktopArmBins() {
    return BinTable({
        {1, "plastic",         "Plastic Bin",         "#3B82F6", Position(220.0, 0.0, 50.0)},
        {2, "banana",          "Organic Waste Bin",   "#EAB308", Position(200.0, 50.0, 50.0)},
        {3, "beverages",       "Beverage Bin",        "#10B981", Position(200.0, -50.0, 50.0)},
        {4, "cardboard_box",   "Cardboard Bin",       "#F59E0B", Position(150.0, 50.0, 50.0)},
        {5, "chips",           "Snack Packaging Bin", "#EF4444", Position(150.0, -50.0, 50.0)},
        {6, "fish_bones",      "Food Waste Bin",      "#8B5CF6", Position(250.0, 50.0, 50.0)},
        {7, "instant_noodles", "Noodle Packaging Bin","#F97316", Position(250.0, -50.0, 50.0)},
        {8, "milk_box_type1",  "Milk Carton Bin 1",   "#06B6D4", Position(180.0, 30.0, 50.0)},
        {9, "milk_box_type2",  "Milk Carton Bin 2",   "#84CC16", Position(180.0, -30.0, 50.0)}
    });
}

} // namespace arm
} // namespace sorting_arm
