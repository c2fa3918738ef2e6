#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include <handpath/synth/config.hpp>
#include <handpath/synth/planner.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>

namespace handpath::synth {

///
/// Bounds on the number of skeleton intervals; a skeleton has one more point.
///
inline constexpr std::size_t k_min_skeleton_intervals = 10;
inline constexpr std::size_t k_max_skeleton_intervals = 100;

///
/// Samples the number of skeleton intervals for a duration.
///
/// Divides the duration by a per-call interval drawn from
/// [min_time_interval, max_time_interval] and clamps the quotient into
/// [k_min_skeleton_intervals, k_max_skeleton_intervals].
///
std::size_t sample_interval_count(double duration, const generator_config& cfg, random_source& rng);

///
/// Cubic ease-in-out: slow start, slow stop, f(0) = 0, f(0.5) = 0.5, f(1) = 1.
///
double ease_in_out_cubic(double t) noexcept;

///
/// Evaluates a quadratic Bezier curve in Bernstein form.
///
Eigen::Vector2d quadratic_bezier(const Eigen::Vector2d& p0, const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, double t) noexcept;

///
/// Evaluates a cubic Bezier curve in Bernstein form.
///
Eigen::Vector2d cubic_bezier(
    const Eigen::Vector2d& p0, const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, const Eigen::Vector2d& p3, double t) noexcept;

///
/// Draws the noise-free skeleton path for a plan.
///
/// Produces N + 1 points at parameters t = i / N. Point i is timestamped
/// t0 + t * plan.duration; the first point sits exactly on start and the last
/// exactly on end.
///
/// - Bezier: control points near the midpoint, offset by up to
///   distance * bezier_control_range; cubic with probability 0.6, else quadratic.
/// - Arc: straight interpolation bowed by arc_height * sin(pi * t) across the
///   dominant axis, arc_height a random 10-30% of distance with a random sign.
/// - Curved direct: straight interpolation with t remapped by ease_in_out_cubic.
///
/// @param start Start position
/// @param end End position
/// @param plan Plan from the planning stage
/// @param t0 Timestamp basis (s)
/// @param cfg Generator configuration
/// @param rng Random source
/// @return Skeleton points; velocity and acceleration are zero
///
std::vector<types::point> generate_skeleton(
    types::point2d start, types::point2d end, const motion_plan& plan, double t0, const generator_config& cfg, random_source& rng);

}  // namespace handpath::synth
