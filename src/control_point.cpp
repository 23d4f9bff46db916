#include "georef/control_point.hpp"

#include <algorithm>
#include <iterator>

namespace georef {

PointStatus point_status(const ControlPoint& point) {
    bool image = has_image_coordinates(point);
    bool map = has_map_coordinates(point);

    if (image && map) return PointStatus::Complete;
    if (image) return PointStatus::ImageOnly;
    if (map) return PointStatus::MapOnly;
    return PointStatus::Empty;
}

bool is_complete(const ControlPoint& point) {
    return point_status(point) == PointStatus::Complete;
}

std::vector<ControlPoint> complete_points(const std::vector<ControlPoint>& points) {
    std::vector<ControlPoint> result;
    std::copy_if(points.begin(), points.end(), std::back_inserter(result),
                 [](const ControlPoint& p) { return is_complete(p); });
    return result;
}

const char* to_string(PointStatus status) {
    switch (status) {
        case PointStatus::Empty: return "empty";
        case PointStatus::ImageOnly: return "image-only";
        case PointStatus::MapOnly: return "map-only";
        case PointStatus::Complete: return "complete";
    }
    return "unknown";
}

} // namespace georef
