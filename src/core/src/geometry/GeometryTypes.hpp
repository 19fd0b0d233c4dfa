/**
 * @file GeometryTypes.hpp
 * @brief Planar points, workspace bounds and calibration point sets
 */

#pragma once

#include <vector>

namespace sorting_arm {
namespace geometry {

struct Point2D {
    double x = 0.0;
    double y = 0.0;

    Point2D() = default;
    Point2D(double x_, double y_) : x(x_), y(y_) {}
};

/**
 * Axis-aligned reachable rectangle in the arm frame (mm), bounds inclusive
 */
struct WorkspaceBounds {
    double x_min = 0.0;
    double x_max = 300.0;
    double y_min = -150.0;
    double y_max = 150.0;

    bool contains(double x, double y) const {
        return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
    }

    bool isValid() const { return x_min < x_max && y_min < y_max; }
};

/**
 * Ordered image <-> arm correspondences. Index i of both lists is one pair.
 */
struct CalibrationPointSet {
    std::vector<Point2D> image_points;
    std::vector<Point2D> robot_points;

    /// 640x480 image corners (TL, TR, BR, BL) and the matching arm positions
    static CalibrationPointSet defaults() {
        CalibrationPointSet set;
        set.image_points = {{0.0, 0.0}, {640.0, 0.0}, {640.0, 480.0}, {0.0, 480.0}};
        set.robot_points = {{91.3, -99.5}, {88.4, 35.5}, {205.7, 40.9}, {211.5, -120.2}};
        return set;
    }
};

} // namespace geometry
} // namespace sorting_arm
