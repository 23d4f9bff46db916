#pragma once

#include <string>
#include <vector>

namespace georef {

struct ImagePoint {
    double x = 0.0;
    double y = 0.0;
};

struct GeoPoint {
    double lat = 0.0;
    double lng = 0.0;
};

struct ControlPoint {
    std::string id;
    ImagePoint image;   // pixels
    GeoPoint map;       // WGS84 degrees
};

enum class PointStatus {
    Empty,
    ImageOnly,
    MapOnly,
    Complete
};

// (0, 0) is the "not placed yet" marker on both sides.
inline bool has_image_coordinates(const ControlPoint& p) { return p.image.x != 0.0 || p.image.y != 0.0; }
inline bool has_map_coordinates(const ControlPoint& p) { return p.map.lat != 0.0 || p.map.lng != 0.0; }

PointStatus point_status(const ControlPoint& point);
bool is_complete(const ControlPoint& point);
std::vector<ControlPoint> complete_points(const std::vector<ControlPoint>& points);

const char* to_string(PointStatus status);

} // namespace georef
