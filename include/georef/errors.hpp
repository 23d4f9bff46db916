#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace georef {

class GeoreferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fewer than kMinControlPoints usable points.
class InsufficientPointsError : public GeoreferenceError {
public:
    InsufficientPointsError(size_t supplied, size_t required)
        : GeoreferenceError("At least " + std::to_string(required) +
                            " control points are required, got " + std::to_string(supplied))
        , supplied_(supplied)
        , required_(required) {}

    size_t supplied() const { return supplied_; }
    size_t required() const { return required_; }

private:
    size_t supplied_;
    size_t required_;
};

// Collinear or coincident points, singular normal equations.
class DegenerateGeometryError : public GeoreferenceError {
public:
    using GeoreferenceError::GeoreferenceError;
};

class CapacityError : public GeoreferenceError {
public:
    using GeoreferenceError::GeoreferenceError;
};

class PlacementStateError : public GeoreferenceError {
public:
    using GeoreferenceError::GeoreferenceError;
};

class InvalidLayerError : public GeoreferenceError {
public:
    using GeoreferenceError::GeoreferenceError;
};

} // namespace georef
