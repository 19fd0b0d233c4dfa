/**
 * @file ArmCapabilities.hpp
 * @brief Optional driver capabilities discovered with dynamic_cast
 */

#pragma once

#include "ArmTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sorting_arm {
namespace arm {

/**
 * Driver runs pick -> bin -> release -> home as one gated operation
 * and knows where each category goes.
 */
class ICompositeSortCapable {
public:
    virtual ~ICompositeSortCapable() = default;

    /**
     * Sort one object of @p category. Rejected while the arm is busy.
     * A failure in the middle of the sequence leaves the arm in Error.
     * @param pickup Where the object lies; the driver's configured pickup
     *               position is used when absent.
     */
    virtual bool sort(const std::string& category,
                      std::optional<Position> pickup = std::nullopt) = 0;

    virtual std::vector<BinInfo> getBins() const = 0;
};

/**
 * Driver keeps cumulative statistics and a bounded operation history.
 */
class ISortingStatistics {
public:
    virtual ~ISortingStatistics() = default;

    virtual SortingStatistics getStatistics() const = 0;

    /// Most recent @p limit records, oldest first
    virtual std::vector<OperationRecord> getOperationHistory(size_t limit = 10) const = 0;

    /// Refused (false) while a motion is in flight
    virtual bool resetStatistics() = 0;
};

} // namespace arm
} // namespace sorting_arm
