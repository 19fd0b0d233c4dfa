/**
 * @file CoordinateTransform.cpp
 * @brief Homography calibration and mapping
 */

#include "CoordinateTransform.hpp"
#include "../logging/Logger.hpp"
#include <Eigen/Dense>
#include <Eigen/SVD>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sorting_arm {
namespace geometry {

namespace {

/**
 * Similarity moving the centroid to the origin with mean distance sqrt(2)
 */
Eigen::Matrix3d normalizationTransform(const std::vector<Point2D>& points) {
    double cx = 0.0, cy = 0.0;
    for (const auto& p : points) {
        cx += p.x;
        cy += p.y;
    }
    cx /= static_cast<double>(points.size());
    cy /= static_cast<double>(points.size());

    double meanDist = 0.0;
    for (const auto& p : points) {
        meanDist += std::hypot(p.x - cx, p.y - cy);
    }
    meanDist /= static_cast<double>(points.size());

    const double s = meanDist > 0.0 ? std::sqrt(2.0) / meanDist : 1.0;

    Eigen::Matrix3d T;
    T << s,   0.0, -s * cx,
         0.0, s,   -s * cy,
         0.0, 0.0, 1.0;
    return T;
}

/// Sine of the angle at @p a in triangle (a, b, c)
double collinearity(const Point2D& a, const Point2D& b, const Point2D& c) {
    const double abx = b.x - a.x, aby = b.y - a.y;
    const double acx = c.x - a.x, acy = c.y - a.y;
    const double lengths = std::hypot(abx, aby) * std::hypot(acx, acy);
    if (lengths <= 0.0) {
        return 0.0;
    }
    return std::abs(abx * acy - aby * acx) / lengths;
}

std::string checkPointSet(const std::vector<Point2D>& points, const char* name, double minDistance) {
    for (size_t i = 0; i < points.size(); ++i) {
        if (!std::isfinite(points[i].x) || !std::isfinite(points[i].y)) {
            return std::string(name) + " point " + std::to_string(i) + " is not finite";
        }
    }

    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            if (std::hypot(points[i].x - points[j].x, points[i].y - points[j].y) < minDistance) {
                return std::string(name) + " points " + std::to_string(i) + " and " +
                       std::to_string(j) + " coincide";
            }
        }
    }

    // With exactly four pairs any collinear triple leaves the system underdetermined
    if (points.size() == 4) {
        for (size_t i = 0; i < 4; ++i) {
            for (size_t j = i + 1; j < 4; ++j) {
                for (size_t k = j + 1; k < 4; ++k) {
                    if (collinearity(points[i], points[j], points[k]) < 1e-6) {
                        return std::string(name) + " points " + std::to_string(i) + ", " +
                               std::to_string(j) + ", " + std::to_string(k) + " are collinear";
                    }
                }
            }
        }
    }
    return "";
}

} // namespace

CoordinateTransform::CoordinateTransform(const CalibrationPointSet& points, TransformSettings settings)
    : m_settings(settings)
{
    if (!m_settings.workspace.isValid()) {
        throw std::invalid_argument("Workspace bounds are empty or inverted");
    }

    m_snapshot = buildSnapshot(points.image_points, points.robot_points);
    if (!m_snapshot) {
        throw std::invalid_argument("Calibration points do not define a homography: " +
                                    validatePoints(points.image_points, points.robot_points));
    }
}

// ============================================================================
// Mapping
// ============================================================================

Point2D CoordinateTransform::apply(const Eigen::Matrix3d& H, double x, double y) {
    const Eigen::Vector3d p = H * Eigen::Vector3d(x, y, 1.0);
    if (std::abs(p.z()) < std::numeric_limits<double>::epsilon()) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        return Point2D(nan, nan);
    }
    return Point2D(p.x() / p.z(), p.y() / p.z());
}

Point2D CoordinateTransform::convert(double x, double y) const {
    return apply(snapshot()->H, x, y);
}

std::vector<Point2D> CoordinateTransform::convertBatch(const std::vector<Point2D>& points) const {
    auto snap = snapshot();
    std::vector<Point2D> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(apply(snap->H, p.x, p.y));
    }
    return result;
}

bool CoordinateTransform::isInWorkspace(double x, double y) const {
    return isInWorkspace(x, y, m_settings.workspace);
}

bool CoordinateTransform::isInWorkspace(double x, double y, const WorkspaceBounds& bounds) const {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }
    return bounds.contains(x, y);
}

std::optional<arm::Position> CoordinateTransform::safeConvert(double x, double y) const {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return std::nullopt;
    }
    Point2D robot = convert(x, y);
    if (!isInWorkspace(robot.x, robot.y)) {
        LOG_DEBUG("Pixel ({:.1f}, {:.1f}) maps to ({:.1f}, {:.1f}), outside workspace",
                  x, y, robot.x, robot.y);
        return std::nullopt;
    }
    return arm::Position(robot.x, robot.y, m_settings.pick_height);
}

// ============================================================================
// Calibration
// ============================================================================

bool CoordinateTransform::updateCalibration(const std::vector<Point2D>& imagePoints,
                                            const std::vector<Point2D>& robotPoints) {
    auto fresh = buildSnapshot(imagePoints, robotPoints);
    if (!fresh) {
        LOG_ERROR("Calibration update rejected, keeping current homography");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot = fresh;
    }
    LOG_INFO("Calibration updated from {} point pairs", imagePoints.size());
    return true;
}

Eigen::Matrix3d CoordinateTransform::getTransformMatrix() const {
    return snapshot()->H;
}

CalibrationPointSet CoordinateTransform::getCalibrationPoints() const {
    return snapshot()->points;
}

Point2D CoordinateTransform::centerPoint() const {
    return snapshot()->center;
}

double CoordinateTransform::reprojectionError() const {
    return snapshot()->rmsError;
}

std::shared_ptr<const CoordinateTransform::Snapshot> CoordinateTransform::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

std::shared_ptr<const CoordinateTransform::Snapshot> CoordinateTransform::buildSnapshot(
    const std::vector<Point2D>& imagePoints,
    const std::vector<Point2D>& robotPoints) const {

    auto H = computeHomography(imagePoints, robotPoints);
    if (!H) {
        return nullptr;
    }

    auto snap = std::make_shared<Snapshot>();
    snap->H = *H;
    snap->points.image_points = imagePoints;
    snap->points.robot_points = robotPoints;
    snap->center = apply(*H, m_settings.image_width / 2.0, m_settings.image_height / 2.0);

    double sumSq = 0.0;
    for (size_t i = 0; i < imagePoints.size(); ++i) {
        Point2D mapped = apply(*H, imagePoints[i].x, imagePoints[i].y);
        const double dx = mapped.x - robotPoints[i].x;
        const double dy = mapped.y - robotPoints[i].y;
        sumSq += dx * dx + dy * dy;
    }
    snap->rmsError = std::sqrt(sumSq / static_cast<double>(imagePoints.size()));

    LOG_INFO("Homography computed: image center -> ({:.2f}, {:.2f}), RMS error {:.4f} mm",
             snap->center.x, snap->center.y, snap->rmsError);
    if (!isInWorkspace(snap->center.x, snap->center.y)) {
        LOG_WARN("Image center maps outside the workspace");
    }
    return snap;
}

// ============================================================================
// Algorithms
// ============================================================================

std::string CoordinateTransform::validatePoints(const std::vector<Point2D>& imagePoints,
                                                const std::vector<Point2D>& robotPoints) {
    if (imagePoints.size() != robotPoints.size()) {
        return "Point count mismatch: " + std::to_string(imagePoints.size()) + " image vs " +
               std::to_string(robotPoints.size()) + " robot";
    }
    if (imagePoints.size() < 4) {
        return "Need at least 4 point pairs, got " + std::to_string(imagePoints.size());
    }

    std::string error = checkPointSet(imagePoints, "Image", MIN_POINT_DISTANCE);
    if (!error.empty()) {
        return error;
    }
    return checkPointSet(robotPoints, "Robot", MIN_POINT_DISTANCE);
}

std::optional<Eigen::Matrix3d> CoordinateTransform::computeHomography(
    const std::vector<Point2D>& imagePoints,
    const std::vector<Point2D>& robotPoints) {

    std::string error = validatePoints(imagePoints, robotPoints);
    if (!error.empty()) {
        LOG_ERROR("Invalid calibration points: {}", error);
        return std::nullopt;
    }

    const Eigen::Matrix3d Ti = normalizationTransform(imagePoints);
    const Eigen::Matrix3d Tr = normalizationTransform(robotPoints);

    // Two rows per correspondence: A h = 0
    const Eigen::Index n = static_cast<Eigen::Index>(imagePoints.size());
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(2 * n, 9);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Vector3d p = Ti * Eigen::Vector3d(imagePoints[i].x, imagePoints[i].y, 1.0);
        const Eigen::Vector3d q = Tr * Eigen::Vector3d(robotPoints[i].x, robotPoints[i].y, 1.0);
        const double x = p.x(), y = p.y();
        const double u = q.x(), v = q.y();

        A.row(2 * i)     << -x, -y, -1.0, 0.0, 0.0, 0.0, u * x, u * y, u;
        A.row(2 * i + 1) << 0.0, 0.0, 0.0, -x, -y, -1.0, v * x, v * y, v;
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeFullV);
    const Eigen::VectorXd& sigma = svd.singularValues();

    // A solution is unique only if A has rank 8
    if (sigma.size() < 8 || sigma(0) <= 0.0 || sigma(7) / sigma(0) < RANK_TOLERANCE) {
        LOG_ERROR("Calibration system is rank deficient (points in degenerate configuration)");
        return std::nullopt;
    }

    const Eigen::VectorXd h = svd.matrixV().col(8);
    Eigen::Matrix3d Hn;
    Hn << h(0), h(1), h(2),
          h(3), h(4), h(5),
          h(6), h(7), h(8);

    Eigen::Matrix3d H = Tr.inverse() * Hn * Ti;

    if (!H.allFinite() || std::abs(H.determinant()) < 1e-12 * std::pow(H.norm(), 3)) {
        LOG_ERROR("Calibration produced a singular homography");
        return std::nullopt;
    }
    if (std::abs(H(2, 2)) > std::numeric_limits<double>::epsilon()) {
        H /= H(2, 2);
    }
    return H;
}

} // namespace geometry
} // namespace sorting_arm
