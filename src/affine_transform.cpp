#include "georef/affine_transform.hpp"
#include "georef/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace georef {

namespace {

// Sums of the normal equations, rows/cols ordered [1, x, y].
struct NormalSums {
    double n = 0;
    double x = 0, y = 0;
    double xx = 0, yy = 0, xy = 0;
    double lat = 0, lat_x = 0, lat_y = 0;
    double lng = 0, lng_x = 0, lng_y = 0;

    double determinant() const {
        return n * (xx * yy - xy * xy) -
               x * (x * yy - y * xy) +
               y * (x * xy - y * xx);
    }
};

// Cramer's rule against the shared Gram matrix for right-hand side (r0, r1, r2).
std::array<double, 3> solve(const NormalSums& s, double r0, double r1, double r2, double det) {
    double c0 = r0 * (s.xx * s.yy - s.xy * s.xy) -
                r1 * (s.x * s.yy - s.y * s.xy) +
                r2 * (s.x * s.xy - s.y * s.xx);

    double c1 = s.n * (r1 * s.yy - r2 * s.xy) -
                r0 * (s.x * s.yy - s.y * s.xy) +
                s.y * (s.x * r2 - s.y * r1);

    double c2 = s.n * (s.xx * r2 - s.xy * r1) -
                s.x * (s.x * r2 - s.y * r1) +
                r0 * (s.x * s.xy - s.y * s.xx);

    return {c0 / det, c1 / det, c2 / det};
}

double error_meters(const AffineTransform& transform, const ControlPoint& p) {
    auto [lat, lng] = transform.project(p.image.x, p.image.y);
    double lat_err = (lat - p.map.lat) * kMetersPerDegree;
    double lng_err = (lng - p.map.lng) * kMetersPerDegree * std::cos(deg2rad(p.map.lat));
    return std::sqrt(lat_err * lat_err + lng_err * lng_err);
}

} // namespace

AffineTransform::AffineTransform(const std::array<double, 6>& coefficients)
    : coeffs_(coefficients) {}

std::pair<double, double> AffineTransform::project(double x, double y) const {
    double lat = a0() + a1() * x + a2() * y;
    double lng = b0() + b1() * x + b2() * y;
    return {lat, lng};
}

std::pair<double, double> AffineTransform::unproject(double lat, double lng) const {
    double det = a1() * b2() - a2() * b1();
    double scale = std::abs(a1() * b2()) + std::abs(a2() * b1());
    if (scale == 0.0 || std::abs(det) <= 4 * std::numeric_limits<double>::epsilon() * scale) {
        throw DegenerateGeometryError("Affine transform is not invertible");
    }

    double dlat = lat - a0();
    double dlng = lng - b0();
    double x = (b2() * dlat - a2() * dlng) / det;
    double y = (a1() * dlng - b1() * dlat) / det;
    return {x, y};
}

AffineTransform fit_affine(const std::vector<ControlPoint>& points, double determinant_tolerance) {
    if (points.size() < kMinControlPoints) {
        throw InsufficientPointsError(points.size(), kMinControlPoints);
    }

    // Centring leaves det(M) unchanged (a translation of x, y is a unimodular
    // change of basis) but keeps the sums small.
    double n = static_cast<double>(points.size());
    double mx = 0, my = 0, mlat = 0, mlng = 0;
    for (const auto& p : points) {
        mx += p.image.x;
        my += p.image.y;
        mlat += p.map.lat;
        mlng += p.map.lng;
    }
    mx /= n;
    my /= n;
    mlat /= n;
    mlng /= n;

    NormalSums s;
    s.n = n;
    for (const auto& p : points) {
        double x = p.image.x - mx;
        double y = p.image.y - my;
        double lat = p.map.lat - mlat;
        double lng = p.map.lng - mlng;

        s.x += x;
        s.y += y;
        s.xx += x * x;
        s.yy += y * y;
        s.xy += x * y;

        s.lat += lat;
        s.lat_x += lat * x;
        s.lat_y += lat * y;

        s.lng += lng;
        s.lng_x += lng * x;
        s.lng_y += lng * y;
    }

    double det = s.determinant();
    if (std::abs(det) < determinant_tolerance) {
        spdlog::debug("Rejecting {} control points: |det| = {:g} below {:g}",
                      points.size(), std::abs(det), determinant_tolerance);
        throw DegenerateGeometryError("Control points are collinear or too close together");
    }

    auto a = solve(s, s.lat, s.lat_x, s.lat_y, det);
    auto b = solve(s, s.lng, s.lng_x, s.lng_y, det);

    // Undo the centring.
    double a0 = mlat + a[0] - a[1] * mx - a[2] * my;
    double b0 = mlng + b[0] - b[1] * mx - b[2] * my;

    spdlog::debug("Fitted affine transform from {} control points (det = {:g})", points.size(), det);
    return AffineTransform({a0, a[1], a[2], b0, b[1], b[2]});
}

GeoBounds compute_bounds(const AffineTransform& transform, double image_width, double image_height) {
    const std::array<std::pair<double, double>, 4> corners = {{
        transform.project(0, 0),
        transform.project(image_width, 0),
        transform.project(image_width, image_height),
        transform.project(0, image_height),
    }};

    GeoBounds bounds{corners[0].first, corners[0].second, corners[0].first, corners[0].second};
    for (const auto& [lat, lng] : corners) {
        bounds.south = std::min(bounds.south, lat);
        bounds.north = std::max(bounds.north, lat);
        bounds.west = std::min(bounds.west, lng);
        bounds.east = std::max(bounds.east, lng);
    }
    return bounds;
}

GeoBounds image_bounds(const std::vector<ControlPoint>& points, double image_width, double image_height) {
    return compute_bounds(fit_affine(points), image_width, image_height);
}

std::vector<double> point_residuals(const AffineTransform& transform, const std::vector<ControlPoint>& points) {
    std::vector<double> residuals;
    residuals.reserve(points.size());
    for (const auto& p : points) {
        residuals.push_back(error_meters(transform, p));
    }
    return residuals;
}

double residual_rmse(const AffineTransform& transform, const std::vector<ControlPoint>& points) {
    if (points.size() < kMinControlPoints) return 0.0;

    double sum_sq = 0.0;
    for (double e : point_residuals(transform, points)) {
        sum_sq += e * e;
    }
    return std::sqrt(sum_sq / static_cast<double>(points.size()));
}

} // namespace georef
