#include "georef/placement_session.hpp"
#include "georef/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace georef {

const char* to_string(PlacementState state) {
    switch (state) {
        case PlacementState::Idle: return "idle";
        case PlacementState::AwaitingImagePoint: return "awaiting-image-point";
        case PlacementState::AwaitingMapPoint: return "awaiting-map-point";
    }
    return "unknown";
}

PlacementSession::PlacementSession(size_t max_points) : max_points_(max_points) {}

std::vector<ControlPoint>::iterator PlacementSession::find(const std::string& id) {
    auto it = std::find_if(points_.begin(), points_.end(),
                           [&id](const ControlPoint& p) { return p.id == id; });
    if (it == points_.end()) {
        throw std::out_of_range("Unknown control point: " + id);
    }
    return it;
}

ControlPoint& PlacementSession::current() {
    return *find(*current_);
}

const std::string& PlacementSession::add_point() {
    if (points_.size() >= max_points_) {
        throw CapacityError("Maximum " + std::to_string(max_points_) + " control points allowed");
    }

    points_.push_back(ControlPoint{"cp-" + std::to_string(next_id_++), {}, {}});
    current_ = points_.back().id;
    state_ = PlacementState::AwaitingImagePoint;
    return points_.back().id;
}

void PlacementSession::select_point(const std::string& id) {
    find(id);
    current_ = id;
    state_ = PlacementState::AwaitingImagePoint;
}

void PlacementSession::remove_point(const std::string& id) {
    points_.erase(find(id));
    if (current_ && *current_ == id) {
        current_.reset();
        state_ = PlacementState::Idle;
    }
}

void PlacementSession::place_image_point(double x, double y) {
    if (state_ != PlacementState::AwaitingImagePoint) {
        throw PlacementStateError(std::string("Cannot place image point while ") + to_string(state_));
    }

    current().image = ImagePoint{x, y};
    state_ = PlacementState::AwaitingMapPoint;
}

void PlacementSession::place_map_point(double lat, double lng) {
    if (state_ != PlacementState::AwaitingMapPoint) {
        throw PlacementStateError(std::string("Cannot place map point while ") + to_string(state_));
    }

    current().map = GeoPoint{lat, lng};
    spdlog::debug("Control point {} placed", *current_);
    current_.reset();
    state_ = PlacementState::Idle;
}

void PlacementSession::cancel() {
    current_.reset();
    state_ = PlacementState::Idle;
}

void PlacementSession::clear() {
    points_.clear();
    cancel();
}

std::vector<ControlPoint> PlacementSession::complete_points() const {
    return georef::complete_points(points_);
}

bool PlacementSession::can_fit() const {
    return complete_points().size() >= kMinControlPoints;
}

double PlacementSession::residual_rmse() const {
    auto points = complete_points();
    if (points.size() < kMinControlPoints) return 0.0;
    return georef::residual_rmse(fit_affine(points), points);
}

} // namespace georef
