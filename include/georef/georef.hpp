#pragma once

#include "georef/errors.hpp"
#include "georef/control_point.hpp"
#include "georef/affine_transform.hpp"
#include "georef/placement_session.hpp"
#include "georef/georeferenced_layer.hpp"

namespace georef {

constexpr const char* VERSION = "0.1.0";

} // namespace georef
