#pragma once

#include <cmath>

namespace handpath::types {

///
/// A position on the pointer plane, in pixels.
///
struct point2d {
    double x;  ///< Horizontal coordinate
    double y;  ///< Vertical coordinate
};

///
/// One time-stamped sample of a pointer trajectory.
///
/// Velocity and acceleration are derived quantities. They are recomputed by the
/// pipeline stages that move the sample and are never treated as authoritative input.
///
struct point {
    double x;                    ///< Horizontal coordinate (px)
    double y;                    ///< Vertical coordinate (px)
    double timestamp;            ///< Seconds on the generator clock's basis
    double velocity_x{0.0};      ///< Derived horizontal velocity (px/s)
    double velocity_y{0.0};      ///< Derived vertical velocity (px/s)
    double acceleration_x{0.0};  ///< Derived horizontal acceleration (px/s^2)
    double acceleration_y{0.0};  ///< Derived vertical acceleration (px/s^2)
};

///
/// Euclidean distance between two positions.
///
inline double distance(const point2d& a, const point2d& b) noexcept {
    return std::hypot(b.x - a.x, b.y - a.y);
}

///
/// Position part of a trajectory point.
///
constexpr point2d position(const point& p) noexcept {
    return {p.x, p.y};
}

///
/// Magnitude of the derived velocity of a point.
///
inline double speed(const point& p) noexcept {
    return std::hypot(p.velocity_x, p.velocity_y);
}

///
/// Magnitude of the derived acceleration of a point.
///
inline double acceleration_magnitude(const point& p) noexcept {
    return std::hypot(p.acceleration_x, p.acceleration_y);
}

}  // namespace handpath::types
