#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "georef/georef.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_georef_cpp, m) {
    m.doc() = "Affine georeferencing of raster images from control points";
    m.attr("__version__") = georef::VERSION;

    auto base = py::register_exception<georef::GeoreferenceError>(m, "GeoreferenceError");
    py::register_exception<georef::InsufficientPointsError>(m, "InsufficientPointsError", base.ptr());
    py::register_exception<georef::DegenerateGeometryError>(m, "DegenerateGeometryError", base.ptr());
    py::register_exception<georef::CapacityError>(m, "CapacityError", base.ptr());
    py::register_exception<georef::PlacementStateError>(m, "PlacementStateError", base.ptr());
    py::register_exception<georef::InvalidLayerError>(m, "InvalidLayerError", base.ptr());

    m.attr("MIN_CONTROL_POINTS") = georef::kMinControlPoints;
    m.attr("MAX_CONTROL_POINTS") = georef::kMaxControlPoints;

    py::class_<georef::ImagePoint>(m, "ImagePoint")
        .def(py::init<>())
        .def(py::init([](double x, double y) { return georef::ImagePoint{x, y}; }), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &georef::ImagePoint::x)
        .def_readwrite("y", &georef::ImagePoint::y);

    py::class_<georef::GeoPoint>(m, "GeoPoint")
        .def(py::init<>())
        .def(py::init([](double lat, double lng) { return georef::GeoPoint{lat, lng}; }), py::arg("lat"), py::arg("lng"))
        .def_readwrite("lat", &georef::GeoPoint::lat)
        .def_readwrite("lng", &georef::GeoPoint::lng);

    py::class_<georef::ControlPoint>(m, "ControlPoint")
        .def(py::init([](const std::string& id, const georef::ImagePoint& image, const georef::GeoPoint& map) {
            return georef::ControlPoint{id, image, map};
        }), py::arg("id"), py::arg("image"), py::arg("map"))
        .def_readwrite("id", &georef::ControlPoint::id)
        .def_readwrite("image", &georef::ControlPoint::image)
        .def_readwrite("map", &georef::ControlPoint::map)
        .def_property_readonly("status", [](const georef::ControlPoint& p) {
            return georef::to_string(georef::point_status(p));
        });

    m.def("complete_points", &georef::complete_points, py::arg("points"));

    py::class_<georef::GeoBounds>(m, "GeoBounds")
        .def_readonly("south", &georef::GeoBounds::south)
        .def_readonly("west", &georef::GeoBounds::west)
        .def_readonly("north", &georef::GeoBounds::north)
        .def_readonly("east", &georef::GeoBounds::east)
        .def("as_pairs", &georef::GeoBounds::as_pairs);

    py::class_<georef::AffineTransform>(m, "AffineTransform")
        .def(py::init<const std::array<double, 6>&>(), py::arg("coefficients"))
        .def_property_readonly("coefficients", &georef::AffineTransform::coefficients)
        .def("project", &georef::AffineTransform::project, py::arg("x"), py::arg("y"))
        .def("unproject", &georef::AffineTransform::unproject, py::arg("lat"), py::arg("lng"));

    m.def("fit_affine", &georef::fit_affine,
          py::arg("points"), py::arg("determinant_tolerance") = georef::kDeterminantTolerance);
    m.def("compute_bounds", &georef::compute_bounds,
          py::arg("transform"), py::arg("image_width"), py::arg("image_height"));
    m.def("image_bounds", &georef::image_bounds,
          py::arg("points"), py::arg("image_width"), py::arg("image_height"));
    m.def("residual_rmse", &georef::residual_rmse, py::arg("transform"), py::arg("points"));
    m.def("point_residuals", &georef::point_residuals, py::arg("transform"), py::arg("points"));

    py::class_<georef::PlacementSession>(m, "PlacementSession")
        .def(py::init<size_t>(), py::arg("max_points") = georef::kMaxControlPoints)
        .def_property_readonly("state", [](const georef::PlacementSession& s) {
            return georef::to_string(s.state());
        })
        .def_property_readonly("current_point", &georef::PlacementSession::current_point)
        .def_property_readonly("points", &georef::PlacementSession::points)
        .def("add_point", &georef::PlacementSession::add_point)
        .def("select_point", &georef::PlacementSession::select_point, py::arg("id"))
        .def("remove_point", &georef::PlacementSession::remove_point, py::arg("id"))
        .def("place_image_point", &georef::PlacementSession::place_image_point, py::arg("x"), py::arg("y"))
        .def("place_map_point", &georef::PlacementSession::place_map_point, py::arg("lat"), py::arg("lng"))
        .def("cancel", &georef::PlacementSession::cancel)
        .def("clear", &georef::PlacementSession::clear)
        .def("complete_points", &georef::PlacementSession::complete_points)
        .def("can_fit", &georef::PlacementSession::can_fit)
        .def("residual_rmse", &georef::PlacementSession::residual_rmse);

    py::class_<georef::LayerDraft>(m, "LayerDraft")
        .def(py::init<>())
        .def_readwrite("name", &georef::LayerDraft::name)
        .def_readwrite("description", &georef::LayerDraft::description)
        .def_readwrite("image_url", &georef::LayerDraft::image_url)
        .def_readwrite("image_width", &georef::LayerDraft::image_width)
        .def_readwrite("image_height", &georef::LayerDraft::image_height)
        .def_readwrite("control_points", &georef::LayerDraft::control_points)
        .def_readwrite("opacity", &georef::LayerDraft::opacity);

    py::class_<georef::GeoreferencedLayer>(m, "GeoreferencedLayer")
        .def_readonly("id", &georef::GeoreferencedLayer::id)
        .def_readonly("name", &georef::GeoreferencedLayer::name)
        .def_readonly("description", &georef::GeoreferencedLayer::description)
        .def_readonly("image_url", &georef::GeoreferencedLayer::image_url)
        .def_readonly("image_width", &georef::GeoreferencedLayer::image_width)
        .def_readonly("image_height", &georef::GeoreferencedLayer::image_height)
        .def_readonly("control_points", &georef::GeoreferencedLayer::control_points)
        .def_readonly("bounds", &georef::GeoreferencedLayer::bounds)
        .def_readonly("opacity", &georef::GeoreferencedLayer::opacity)
        .def_readonly("visible", &georef::GeoreferencedLayer::visible)
        .def_readonly("residual_rmse", &georef::GeoreferencedLayer::residual_rmse);

    m.def("build_layer", &georef::build_layer, py::arg("draft"), py::arg("id"));
}
