#pragma once

#include "georef/affine_transform.hpp"
#include "georef/control_point.hpp"

#include <string>
#include <vector>

namespace georef {

constexpr double kDefaultOpacity = 0.7;

struct LayerDraft {
    std::string name;
    std::string description;
    std::string image_url;
    int image_width = 0;
    int image_height = 0;
    std::vector<ControlPoint> control_points;
    double opacity = kDefaultOpacity;
};

struct GeoreferencedLayer {
    std::string id;
    std::string name;
    std::string description;
    std::string image_url;
    int image_width;
    int image_height;
    std::vector<ControlPoint> control_points;
    GeoBounds bounds;
    double opacity;
    bool visible;
    double residual_rmse;   // meters
};

// Validates the draft and derives bounds and fit quality from its control points.
GeoreferencedLayer build_layer(const LayerDraft& draft, const std::string& id);

} // namespace georef
