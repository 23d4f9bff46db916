#pragma once

#include "georef/affine_transform.hpp"
#include "georef/control_point.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace georef {

enum class PlacementState {
    Idle,
    AwaitingImagePoint,
    AwaitingMapPoint
};

const char* to_string(PlacementState state);

/**
 * Two-click placement of control points: first on the raster, then on the map.
 *
 * Owned by the editing view; nothing here is shared between sessions.
 * Placement calls made in the wrong state throw PlacementStateError.
 */
class PlacementSession {
public:
    explicit PlacementSession(size_t max_points = kMaxControlPoints);

    const std::string& add_point();
    void select_point(const std::string& id);
    void remove_point(const std::string& id);
    void place_image_point(double x, double y);
    void place_map_point(double lat, double lng);
    void cancel();
    void clear();

    PlacementState state() const { return state_; }
    const std::optional<std::string>& current_point() const { return current_; }
    const std::vector<ControlPoint>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    size_t capacity() const { return max_points_; }

    std::vector<ControlPoint> complete_points() const;
    bool can_fit() const;
    double residual_rmse() const;

private:
    std::vector<ControlPoint>::iterator find(const std::string& id);
    ControlPoint& current();

    size_t max_points_;
    size_t next_id_ = 1;
    PlacementState state_ = PlacementState::Idle;
    std::optional<std::string> current_;
    std::vector<ControlPoint> points_;
};

} // namespace georef
