/**
 * @file CoordinateTransform.hpp
 * @brief Image pixel -> arm plane mapping through a calibrated homography
 */

#pragma once

#include "GeometryTypes.hpp"
#include "../arm/ArmTypes.hpp"
#include <Eigen/Core>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sorting_arm {
namespace geometry {

struct TransformSettings {
    WorkspaceBounds workspace;
    double pick_height = 0.0;       // z of every target produced by safeConvert (mm)
    double image_width = 640.0;
    double image_height = 480.0;
};

/**
 * Planar homography between camera pixels and the arm's XY plane.
 *
 * The active matrix and its calibration points form one immutable
 * snapshot. Recalibration builds a new snapshot and swaps it in, so a
 * reader sees either the old or the new mapping, never a mix.
 */
class CoordinateTransform {
public:
    /**
     * @throws std::invalid_argument if the correspondences are degenerate
     */
    explicit CoordinateTransform(const CalibrationPointSet& points = CalibrationPointSet::defaults(),
                                 TransformSettings settings = TransformSettings{});

    CoordinateTransform(const CoordinateTransform&) = delete;
    CoordinateTransform& operator=(const CoordinateTransform&) = delete;

    // ========================================================================
    // Mapping
    // ========================================================================

    /**
     * Map one pixel to the arm plane. NaN coordinates when the pixel lies
     * on the homography's line at infinity.
     */
    Point2D convert(double x, double y) const;

    /// Order-preserving convert() of every point with one snapshot
    std::vector<Point2D> convertBatch(const std::vector<Point2D>& points) const;

    bool isInWorkspace(double x, double y) const;
    bool isInWorkspace(double x, double y, const WorkspaceBounds& bounds) const;

    /**
     * convert() followed by the workspace check.
     * @return target at the configured pick height, nullopt if outside
     */
    std::optional<arm::Position> safeConvert(double x, double y) const;

    // ========================================================================
    // Calibration
    // ========================================================================

    /**
     * Recompute from new correspondences. On failure the current
     * mapping stays active and false is returned.
     */
    bool updateCalibration(const std::vector<Point2D>& imagePoints,
                           const std::vector<Point2D>& robotPoints);

    Eigen::Matrix3d getTransformMatrix() const;
    CalibrationPointSet getCalibrationPoints() const;

    /// Image center mapped to the arm plane
    Point2D centerPoint() const;

    /// RMS distance (mm) between mapped image points and their arm points
    double reprojectionError() const;

    const WorkspaceBounds& workspace() const { return m_settings.workspace; }
    double pickHeight() const { return m_settings.pick_height; }

    // ========================================================================
    // Algorithms
    // ========================================================================

    /**
     * @return Error message if the correspondences cannot define a homography,
     *         empty if OK
     */
    static std::string validatePoints(const std::vector<Point2D>& imagePoints,
                                      const std::vector<Point2D>& robotPoints);

    /**
     * Normalized DLT. Exact for 4 pairs, least squares for more.
     * @return nullopt (with the reason logged) for degenerate input
     */
    static std::optional<Eigen::Matrix3d> computeHomography(const std::vector<Point2D>& imagePoints,
                                                            const std::vector<Point2D>& robotPoints);

    static Point2D apply(const Eigen::Matrix3d& H, double x, double y);

private:
    struct Snapshot {
        Eigen::Matrix3d H;
        CalibrationPointSet points;
        Point2D center;
        double rmsError = 0.0;
    };

    std::shared_ptr<const Snapshot> buildSnapshot(const std::vector<Point2D>& imagePoints,
                                                  const std::vector<Point2D>& robotPoints) const;
    std::shared_ptr<const Snapshot> snapshot() const;

    // Minimum separation between two calibration points
    static constexpr double MIN_POINT_DISTANCE = 1e-3;

    // Relative threshold below which singular values count as zero
    static constexpr double RANK_TOLERANCE = 1e-10;

    TransformSettings m_settings;

    mutable std::mutex m_mutex;
    std::shared_ptr<const Snapshot> m_snapshot;
};

} // namespace geometry
} // namespace sorting_arm
