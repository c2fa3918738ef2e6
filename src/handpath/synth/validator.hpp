#pragma once

#include <cstddef>
#include <vector>

#include <handpath/synth/config.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>

namespace handpath::synth {

///
/// Jitter (+/- px per axis) applied to each point synthesized during gap repair.
///
inline constexpr double k_intermediate_jitter = 1.0;

///
/// Counts of the repairs made by one run of the validation stage.
///
struct validation_report {
    std::size_t clamped_timestamps{0};      ///< Points moved later to respect min_time_interval
    std::size_t damped_accelerations{0};    ///< Points pulled toward their predecessor
    std::size_t residual_accelerations{0};  ///< Damped points still above max_acceleration
    std::size_t repaired_gaps{0};           ///< Gaps replaced by synthesized points
    std::size_t unrepaired_gaps{0};         ///< Gaps left above the gap limit
    std::size_t synthesized_points{0};      ///< Points inserted by gap repair
};

///
/// Final pass enforcing the timing and acceleration invariants.
///
/// Rebuilds the sequence left to right, seeded with the first input point
/// unchanged. Each further input point is compared against the last accepted
/// output point:
///
/// - A time step below min_time_interval is stretched to exactly min_time_interval.
/// - A time step above max_gap_multiple * max_time_interval is repaired: points
///   are interpolated across the gap (at fractions i / (k + 1), each jittered by
///   k_intermediate_jitter) and the input point itself is dropped. A gap gets
///   floor(dt / max_time_interval) points when the budget allows it after keeping
///   back what later gaps need, and otherwise the fewest points that bring every
///   step within the gap limit. The count is reduced where needed to keep
///   synthesized spacing at or above min_time_interval and the total output
///   within max_trajectory_points; if no point fits, the input point is accepted
///   as is. Gaps left above the limit are counted in unrepaired_gaps.
/// - On acceptance, a point whose acceleration magnitude exceeds max_acceleration
///   is moved to the midpoint between itself and its predecessor, and its velocity
///   and acceleration are recomputed from the new position. Points whose
///   recomputed acceleration is still above the cap are counted in
///   residual_accelerations.
///
/// @param points Points from the smoothing stage
/// @param cfg Generator configuration
/// @param rng Random source (gap-repair jitter)
/// @param report Optional sink for counts of repairs
/// @return Validated points
///
std::vector<types::point> validate_trajectory(std::vector<types::point> points,
                                              const generator_config& cfg,
                                              random_source& rng,
                                              validation_report* report = nullptr);

}  // namespace handpath::synth
