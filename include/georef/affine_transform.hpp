#pragma once

#include "georef/control_point.hpp"

#include <cmath>
#include <array>
#include <cstddef>
#include <utility>
#include <vector>

namespace georef {

constexpr size_t kMinControlPoints = 3;
constexpr size_t kMaxControlPoints = 6;
constexpr double kDeterminantTolerance = 1e-10;
constexpr double kMetersPerDegree = 111320.0;

/**
 * Pixel to geographic affine model:
 *   lat = a0 + a1*x + a2*y
 *   lng = b0 + b1*x + b2*y
 * Coefficients are stored as {a0, a1, a2, b0, b1, b2}.
 */
class AffineTransform {
public:
    explicit AffineTransform(const std::array<double, 6>& coefficients);

    std::pair<double, double> project(double x, double y) const;
    std::pair<double, double> unproject(double lat, double lng) const;

    const std::array<double, 6>& coefficients() const { return coeffs_; }
    double a0() const { return coeffs_[0]; }
    double a1() const { return coeffs_[1]; }
    double a2() const { return coeffs_[2]; }
    double b0() const { return coeffs_[3]; }
    double b1() const { return coeffs_[4]; }
    double b2() const { return coeffs_[5]; }

private:
    std::array<double, 6> coeffs_;
};

// Axis-aligned envelope of the projected image corners.
struct GeoBounds {
    double south;
    double west;
    double north;
    double east;

    // [[south, west], [north, east]], the shape image overlays take.
    std::array<std::array<double, 2>, 2> as_pairs() const {
        return {{{south, west}, {north, east}}};
    }
};

/**
 * Least-squares fit over the normal equations, solved by Cramer's rule.
 * Throws InsufficientPointsError below kMinControlPoints and
 * DegenerateGeometryError when |det| < determinant_tolerance.
 */
AffineTransform fit_affine(const std::vector<ControlPoint>& points,
                           double determinant_tolerance = kDeterminantTolerance);

GeoBounds compute_bounds(const AffineTransform& transform, double image_width, double image_height);

GeoBounds image_bounds(const std::vector<ControlPoint>& points, double image_width, double image_height);

// RMSE in meters; 0 below kMinControlPoints.
double residual_rmse(const AffineTransform& transform, const std::vector<ControlPoint>& points);

std::vector<double> point_residuals(const AffineTransform& transform, const std::vector<ControlPoint>& points);

// Inline utility
inline double deg2rad(double deg) { return deg * M_PI / 180.0; }

} // namespace georef
