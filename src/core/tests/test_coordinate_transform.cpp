/**
 * @file test_coordinate_transform.cpp
 * @brief Homography calibration and pixel -> arm mapping tests
 */

#include <gtest/gtest.h>
#include "geometry/CoordinateTransform.hpp"
#include "logging/Logger.hpp"
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace sorting_arm;
using namespace sorting_arm::geometry;

class CoordinateTransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_coordinate_transform.log", "debug");
        points = CalibrationPointSet::defaults();
    }

    static std::vector<Point2D> scaled(const std::vector<Point2D>& in, double factor) {
        std::vector<Point2D> out;
        for (const auto& p : in) {
            out.emplace_back(p.x * factor, p.y * factor);
        }
        return out;
    }

    CalibrationPointSet points;
};

// ============================================================================
// Mapping
// ============================================================================

TEST_F(CoordinateTransformTest, CornersMapToRobotPoints) {
    CoordinateTransform transform(points);

    for (size_t i = 0; i < points.image_points.size(); ++i) {
        auto mapped = transform.convert(points.image_points[i].x, points.image_points[i].y);
        EXPECT_NEAR(mapped.x, points.robot_points[i].x, 1e-3) << "corner " << i;
        EXPECT_NEAR(mapped.y, points.robot_points[i].y, 1e-3) << "corner " << i;
    }
    EXPECT_LT(transform.reprojectionError(), 1e-6);
}

TEST_F(CoordinateTransformTest, ImageCenterMapsInsideWorkspace) {
    CoordinateTransform transform(points);

    auto center = transform.convert(320.0, 240.0);
    EXPECT_NEAR(center.x, 143.9994, 1e-3);
    EXPECT_NEAR(center.y, -34.8235, 1e-3);
    EXPECT_TRUE(transform.isInWorkspace(center.x, center.y));

    auto reported = transform.centerPoint();
    EXPECT_NEAR(reported.x, center.x, 1e-9);
    EXPECT_NEAR(reported.y, center.y, 1e-9);
}

TEST_F(CoordinateTransformTest, MatrixIsNormalized) {
    CoordinateTransform transform(points);
    auto H = transform.getTransformMatrix();
    EXPECT_NEAR(H(2, 2), 1.0, 1e-12);
}

TEST_F(CoordinateTransformTest, BatchPreservesOrder) {
    CoordinateTransform transform(points);

    std::vector<Point2D> pixels = {{320.0, 240.0}, {0.0, 0.0}, {640.0, 480.0}, {100.0, 50.0}};
    auto batch = transform.convertBatch(pixels);

    ASSERT_EQ(batch.size(), pixels.size());
    for (size_t i = 0; i < pixels.size(); ++i) {
        auto single = transform.convert(pixels[i].x, pixels[i].y);
        EXPECT_DOUBLE_EQ(batch[i].x, single.x);
        EXPECT_DOUBLE_EQ(batch[i].y, single.y);
    }
    EXPECT_TRUE(transform.convertBatch({}).empty());
}

TEST_F(CoordinateTransformTest, WorkspaceBoundsAreInclusive) {
    CoordinateTransform transform(points);

    EXPECT_TRUE(transform.isInWorkspace(0.0, -150.0));
    EXPECT_TRUE(transform.isInWorkspace(300.0, 150.0));
    EXPECT_FALSE(transform.isInWorkspace(300.01, 0.0));
    EXPECT_FALSE(transform.isInWorkspace(-0.01, 0.0));
    EXPECT_FALSE(transform.isInWorkspace(std::numeric_limits<double>::quiet_NaN(), 0.0));
    EXPECT_FALSE(transform.isInWorkspace(0.0, std::numeric_limits<double>::infinity()));

    WorkspaceBounds custom{10.0, 20.0, -5.0, 5.0};
    EXPECT_TRUE(transform.isInWorkspace(15.0, 0.0, custom));
    EXPECT_FALSE(transform.isInWorkspace(150.0, 0.0, custom));
}

TEST_F(CoordinateTransformTest, SafeConvertFiltersAndUsesPickHeight) {
    TransformSettings settings;
    settings.workspace = WorkspaceBounds{140.0, 150.0, -40.0, -30.0};
    settings.pick_height = 12.5;
    CoordinateTransform transform(points, settings);

    auto inside = transform.safeConvert(320.0, 240.0);
    ASSERT_TRUE(inside.has_value());
    EXPECT_NEAR(inside->x, 143.9994, 1e-3);
    EXPECT_NEAR(inside->y, -34.8235, 1e-3);
    EXPECT_DOUBLE_EQ(inside->z, 12.5);

    // Top-left corner maps to (91.3, -99.5)
    EXPECT_FALSE(transform.safeConvert(0.0, 0.0).has_value());
    EXPECT_FALSE(transform.safeConvert(std::numeric_limits<double>::quiet_NaN(), 240.0).has_value());
}

TEST_F(CoordinateTransformTest, LeastSquaresWithExtraConsistentPoint) {
    CoordinateTransform reference(points);
    auto center = reference.convert(320.0, 240.0);

    auto extended = points;
    extended.image_points.emplace_back(320.0, 240.0);
    extended.robot_points.push_back(center);

    CoordinateTransform transform(extended);
    for (size_t i = 0; i < points.image_points.size(); ++i) {
        auto mapped = transform.convert(points.image_points[i].x, points.image_points[i].y);
        EXPECT_NEAR(mapped.x, points.robot_points[i].x, 1e-3);
        EXPECT_NEAR(mapped.y, points.robot_points[i].y, 1e-3);
    }
    EXPECT_LT(transform.reprojectionError(), 1e-3);
}

// ============================================================================
// Degenerate input
// ============================================================================

TEST_F(CoordinateTransformTest, RejectsTooFewPoints) {
    CalibrationPointSet three;
    three.image_points = {{0, 0}, {640, 0}, {640, 480}};
    three.robot_points = {{91.3, -99.5}, {88.4, 35.5}, {205.7, 40.9}};

    EXPECT_THROW(CoordinateTransform transform(three), std::invalid_argument);
    EXPECT_FALSE(CoordinateTransform::validatePoints(three.image_points, three.robot_points).empty());
}

TEST_F(CoordinateTransformTest, RejectsCountMismatch) {
    auto bad = points;
    bad.robot_points.pop_back();
    EXPECT_THROW(CoordinateTransform transform(bad), std::invalid_argument);
}

TEST_F(CoordinateTransformTest, RejectsCollinearPoints) {
    auto bad = points;
    bad.image_points = {{0, 0}, {100, 0}, {200, 0}, {0, 100}};
    EXPECT_THROW(CoordinateTransform transform(bad), std::invalid_argument);
    EXPECT_FALSE(CoordinateTransform::computeHomography(bad.image_points, bad.robot_points).has_value());
}

TEST_F(CoordinateTransformTest, RejectsDuplicatePoints) {
    auto bad = points;
    bad.image_points[2] = bad.image_points[1];
    EXPECT_THROW(CoordinateTransform transform(bad), std::invalid_argument);
}

TEST_F(CoordinateTransformTest, RejectsNonFiniteCoordinates) {
    auto bad = points;
    bad.robot_points[0].x = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(CoordinateTransform::validatePoints(bad.image_points, bad.robot_points).empty());
}

// ============================================================================
// Recalibration
// ============================================================================

TEST_F(CoordinateTransformTest, UpdateReplacesMapping) {
    CoordinateTransform transform(points);

    auto half = scaled(points.image_points, 0.5);
    ASSERT_TRUE(transform.updateCalibration(points.image_points, half));

    auto mapped = transform.convert(320.0, 240.0);
    EXPECT_NEAR(mapped.x, 160.0, 1e-6);
    EXPECT_NEAR(mapped.y, 120.0, 1e-6);

    auto stored = transform.getCalibrationPoints();
    ASSERT_EQ(stored.robot_points.size(), 4u);
    EXPECT_DOUBLE_EQ(stored.robot_points[1].x, 320.0);
}

TEST_F(CoordinateTransformTest, FailedUpdateKeepsMapping) {
    CoordinateTransform transform(points);
    auto before = transform.getTransformMatrix();

    std::vector<Point2D> collinear = {{0, 0}, {100, 100}, {200, 200}, {300, 300}};
    EXPECT_FALSE(transform.updateCalibration(collinear, points.robot_points));
    EXPECT_FALSE(transform.updateCalibration(points.image_points, std::vector<Point2D>{Point2D(0, 0)}));

    EXPECT_TRUE(transform.getTransformMatrix().isApprox(before));
    auto center = transform.convert(320.0, 240.0);
    EXPECT_NEAR(center.x, 143.9994, 1e-3);
}

TEST_F(CoordinateTransformTest, ConcurrentReadersSeeWholeMappings) {
    CoordinateTransform transform(points);
    auto tenth = scaled(points.image_points, 0.1);

    // (640, 0) maps to (88.4, 35.5) under the defaults and (64, 0) under the scaled set
    std::atomic<bool> stop{false};
    std::atomic<int> mixed{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                auto p = transform.convert(640.0, 0.0);
                bool a = std::abs(p.x - 88.4) < 1e-3 && std::abs(p.y - 35.5) < 1e-3;
                bool b = std::abs(p.x - 64.0) < 1e-3 && std::abs(p.y) < 1e-3;
                if (!a && !b) {
                    ++mixed;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        EXPECT_TRUE(transform.updateCalibration(points.image_points, (i % 2) ? points.robot_points : tenth));
    }
    stop = true;
    for (auto& r : readers) {
        r.join();
    }

    EXPECT_EQ(mixed.load(), 0);
}
