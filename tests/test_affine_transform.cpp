#include <gtest/gtest.h>
#include "georef/affine_transform.hpp"
#include "georef/errors.hpp"
#include <algorithm>
#include <cmath>

using georef::ControlPoint;

class AffineTransformTest : public ::testing::Test {
protected:
    // Scanned site plan near 31.45N 34.8E
    std::vector<ControlPoint> three_points = {
        {"cp-1", {120.0, 80.0}, {31.4521, 34.8012}},
        {"cp-2", {900.0, 150.0}, {31.4518, 34.8097}},
        {"cp-3", {400.0, 700.0}, {31.4463, 34.8041}},
    };

    // lat follows image y, lng follows image x
    std::vector<ControlPoint> square = {
        {"a", {0.0, 0.0}, {0.0, 0.0}},
        {"b", {100.0, 0.0}, {0.0, 0.001}},
        {"c", {100.0, 100.0}, {0.001, 0.001}},
        {"d", {0.0, 100.0}, {0.001, 0.0}},
    };
};

TEST_F(AffineTransformTest, ProjectEvaluatesBothEquations) {
    georef::AffineTransform t({31.0, 0.001, -0.002, 34.0, 0.003, 0.0005});

    auto [lat, lng] = t.project(10.0, 20.0);

    EXPECT_NEAR(lat, 31.0 + 0.01 - 0.04, 1e-12);
    EXPECT_NEAR(lng, 34.0 + 0.03 + 0.01, 1e-12);
}

TEST_F(AffineTransformTest, ThreePointsFitExactly) {
    auto t = georef::fit_affine(three_points);

    for (const auto& p : three_points) {
        auto [lat, lng] = t.project(p.image.x, p.image.y);
        EXPECT_NEAR(lat, p.map.lat, 1e-10);
        EXPECT_NEAR(lng, p.map.lng, 1e-10);
    }
    EXPECT_LT(georef::residual_rmse(t, three_points), 1e-6);
}

TEST_F(AffineTransformTest, RejectsFewerThanThreePoints) {
    for (size_t n = 0; n < 3; n++) {
        std::vector<ControlPoint> points(three_points.begin(), three_points.begin() + n);
        EXPECT_THROW(georef::fit_affine(points), georef::InsufficientPointsError);
    }

    try {
        georef::fit_affine({three_points[0], three_points[1]});
        FAIL() << "expected InsufficientPointsError";
    } catch (const georef::InsufficientPointsError& e) {
        EXPECT_EQ(e.supplied(), 2u);
        EXPECT_EQ(e.required(), 3u);
    }
}

TEST_F(AffineTransformTest, RejectsCollinearPoints) {
    std::vector<ControlPoint> collinear = {
        {"a", {0.0, 0.0}, {31.45, 34.80}},
        {"b", {10.0, 10.0}, {31.46, 34.81}},
        {"c", {20.0, 20.0}, {31.40, 34.70}},
    };

    EXPECT_THROW(georef::fit_affine(collinear), georef::DegenerateGeometryError);
}

TEST_F(AffineTransformTest, RejectsCoincidentPoints) {
    std::vector<ControlPoint> same = {
        {"a", {250.0, 250.0}, {31.45, 34.80}},
        {"b", {250.0, 250.0}, {31.46, 34.81}},
        {"c", {250.0, 250.0}, {31.47, 34.82}},
        {"d", {250.0, 250.0}, {31.48, 34.83}},
    };

    EXPECT_THROW(georef::fit_affine(same), georef::DegenerateGeometryError);
}

TEST_F(AffineTransformTest, ToleranceIsConfigurable) {
    EXPECT_NO_THROW(georef::fit_affine(three_points));
    EXPECT_THROW(georef::fit_affine(three_points, 1e30), georef::DegenerateGeometryError);
}

TEST_F(AffineTransformTest, ScalingAndTranslationReproducesEnvelope) {
    auto t = georef::fit_affine(square);
    auto bounds = georef::compute_bounds(t, 100, 100);

    EXPECT_NEAR(bounds.south, 0.0, 1e-12);
    EXPECT_NEAR(bounds.west, 0.0, 1e-12);
    EXPECT_NEAR(bounds.north, 0.001, 1e-12);
    EXPECT_NEAR(bounds.east, 0.001, 1e-12);
}

TEST_F(AffineTransformTest, BoundsPairsShape) {
    georef::GeoBounds bounds{31.0, 34.0, 32.0, 35.0};
    auto pairs = bounds.as_pairs();

    EXPECT_EQ(pairs[0][0], 31.0);   // south
    EXPECT_EQ(pairs[0][1], 34.0);   // west
    EXPECT_EQ(pairs[1][0], 32.0);   // north
    EXPECT_EQ(pairs[1][1], 35.0);   // east
}

TEST_F(AffineTransformTest, InconsistentFourthPointIncreasesResidual) {
    auto baseline = georef::residual_rmse(georef::fit_affine(three_points), three_points);

    auto four = three_points;
    four.push_back({"cp-4", {700.0, 600.0}, {31.4400, 34.8200}});
    auto rmse = georef::residual_rmse(georef::fit_affine(four), four);

    EXPECT_GT(rmse, baseline);
    EXPECT_GT(rmse, 1.0);
}

TEST_F(AffineTransformTest, PointOrderDoesNotChangeFit) {
    auto points = three_points;
    points.push_back({"cp-4", {700.0, 600.0}, {31.4471, 34.8088}});
    points.push_back({"cp-5", {50.0, 650.0}, {31.4466, 34.8005}});

    auto reference = georef::fit_affine(points).coefficients();

    std::reverse(points.begin(), points.end());
    auto reversed = georef::fit_affine(points).coefficients();

    std::rotate(points.begin(), points.begin() + 2, points.end());
    auto rotated = georef::fit_affine(points).coefficients();

    for (size_t i = 0; i < reference.size(); i++) {
        EXPECT_NEAR(reversed[i], reference[i], 1e-10) << "coefficient " << i;
        EXPECT_NEAR(rotated[i], reference[i], 1e-10) << "coefficient " << i;
    }
}

TEST_F(AffineTransformTest, BoundsOrderedUnderRotation) {
    for (int deg = 0; deg < 360; deg += 15) {
        double c = std::cos(georef::deg2rad(deg)) * 1e-5;
        double s = std::sin(georef::deg2rad(deg)) * 1e-5;
        georef::AffineTransform t({31.45, -s, c, 34.80, c, s});

        auto b = georef::compute_bounds(t, 640, 480);
        EXPECT_LE(b.south, b.north) << deg;
        EXPECT_LE(b.west, b.east) << deg;

        const std::vector<std::pair<double, double>> corners = {{0.0, 0.0}, {640.0, 0.0}, {640.0, 480.0}, {0.0, 480.0}};
        for (auto [x, y] : corners) {
            auto [lat, lng] = t.project(x, y);
            EXPECT_GE(lat, b.south);
            EXPECT_LE(lat, b.north);
            EXPECT_GE(lng, b.west);
            EXPECT_LE(lng, b.east);
        }
    }
}

TEST_F(AffineTransformTest, ImageBoundsFitsThenProjects) {
    auto direct = georef::compute_bounds(georef::fit_affine(three_points), 1024, 768);
    auto bounds = georef::image_bounds(three_points, 1024, 768);

    EXPECT_DOUBLE_EQ(bounds.south, direct.south);
    EXPECT_DOUBLE_EQ(bounds.west, direct.west);
    EXPECT_DOUBLE_EQ(bounds.north, direct.north);
    EXPECT_DOUBLE_EQ(bounds.east, direct.east);

    EXPECT_THROW(georef::image_bounds({three_points[0]}, 1024, 768), georef::InsufficientPointsError);
}

TEST_F(AffineTransformTest, ResidualConvertsDegreesToMeters) {
    // Everything projects to (60, 10); cos(60) halves the longitude meters.
    georef::AffineTransform t({60.0, 0.0, 0.0, 10.0, 0.0, 0.0});
    std::vector<ControlPoint> points = {
        {"a", {1.0, 1.0}, {60.0, 10.001}},
        {"b", {2.0, 5.0}, {60.0, 10.001}},
        {"c", {9.0, 3.0}, {60.0, 10.001}},
    };

    EXPECT_NEAR(georef::residual_rmse(t, points), 55.66, 1e-6);

    georef::AffineTransform equator({0.0, 0.0, 0.0, 0.0, 0.0, 0.0});
    std::vector<ControlPoint> north = {
        {"a", {1.0, 1.0}, {0.0001, 0.0}},
        {"b", {2.0, 5.0}, {0.0001, 0.0}},
        {"c", {9.0, 3.0}, {0.0001, 0.0}},
    };
    EXPECT_NEAR(georef::residual_rmse(equator, north), 11.132, 1e-6);
}

TEST_F(AffineTransformTest, ResidualIsZeroBelowMinimumPoints) {
    georef::AffineTransform t({60.0, 0.0, 0.0, 10.0, 0.0, 0.0});
    std::vector<ControlPoint> points = {
        {"a", {1.0, 1.0}, {61.0, 11.0}},
        {"b", {2.0, 5.0}, {61.0, 11.0}},
    };

    EXPECT_EQ(georef::residual_rmse(t, points), 0.0);
    EXPECT_EQ(georef::residual_rmse(t, {}), 0.0);
}

TEST_F(AffineTransformTest, PointResidualsMatchRmse) {
    auto four = three_points;
    four.push_back({"cp-4", {700.0, 600.0}, {31.4400, 34.8200}});
    auto t = georef::fit_affine(four);

    auto residuals = georef::point_residuals(t, four);
    ASSERT_EQ(residuals.size(), four.size());

    double sum_sq = 0.0;
    for (double r : residuals) {
        EXPECT_GE(r, 0.0);
        sum_sq += r * r;
    }
    EXPECT_NEAR(std::sqrt(sum_sq / four.size()), georef::residual_rmse(t, four), 1e-9);
}

TEST_F(AffineTransformTest, UnprojectInvertsProject) {
    auto t = georef::fit_affine(three_points);

    auto [lat, lng] = t.project(250.0, 310.0);
    auto [x, y] = t.unproject(lat, lng);

    EXPECT_NEAR(x, 250.0, 1e-6);
    EXPECT_NEAR(y, 310.0, 1e-6);
}

TEST_F(AffineTransformTest, UnprojectRejectsSingularTransform) {
    georef::AffineTransform t({31.0, 1e-5, 2e-5, 34.0, 2e-5, 4e-5});

    EXPECT_THROW(t.unproject(31.0, 34.0), georef::DegenerateGeometryError);
}

TEST_F(AffineTransformTest, CoefficientsRoundTripThroughConstructor) {
    auto fitted = georef::fit_affine(three_points);
    georef::AffineTransform reloaded(fitted.coefficients());

    auto [lat1, lng1] = fitted.project(333.0, 444.0);
    auto [lat2, lng2] = reloaded.project(333.0, 444.0);
    EXPECT_EQ(lat1, lat2);
    EXPECT_EQ(lng1, lng2);
}
