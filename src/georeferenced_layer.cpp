#include "georef/georeferenced_layer.hpp"
#include "georef/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace georef {

namespace {
bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}
}

GeoreferencedLayer build_layer(const LayerDraft& draft, const std::string& id) {
    if (is_blank(draft.name)) throw InvalidLayerError("Layer name is required");
    if (draft.image_url.empty()) throw InvalidLayerError("Layer image is required");
    if (draft.image_width <= 0 || draft.image_height <= 0) {
        throw InvalidLayerError("Image size must be positive");
    }
    if (!(draft.opacity >= 0.0 && draft.opacity <= 1.0)) {
        throw InvalidLayerError("Opacity must be within [0, 1]");
    }
    if (draft.control_points.size() < kMinControlPoints) {
        throw InsufficientPointsError(draft.control_points.size(), kMinControlPoints);
    }

    auto incomplete = std::find_if_not(draft.control_points.begin(), draft.control_points.end(), is_complete);
    if (incomplete != draft.control_points.end()) {
        throw InvalidLayerError("Control point " + incomplete->id + " is not placed on both the image and the map");
    }

    AffineTransform transform = fit_affine(draft.control_points);

    GeoreferencedLayer layer{
        id,
        draft.name,
        draft.description,
        draft.image_url,
        draft.image_width,
        draft.image_height,
        draft.control_points,
        compute_bounds(transform, draft.image_width, draft.image_height),
        draft.opacity,
        true,
        residual_rmse(transform, draft.control_points)
    };

    spdlog::info("Built layer '{}' from {} control points, RMSE {:.2f} m",
                 layer.name, layer.control_points.size(), layer.residual_rmse);
    return layer;
}

} // namespace georef
