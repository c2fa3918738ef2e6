#pragma once

#include <cstddef>
#include <vector>

#include <handpath/synth/config.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>
#include <handpath/types/value_range.hpp>

namespace handpath::synth {

///
/// Perturbation magnitudes applied by the characteristics stage.
///
inline constexpr double k_micro_correction_extent = 3.0;                   ///< +/- px per axis
inline constexpr types::value_range k_pause_duration{0.05, 0.2};          ///< s added to a timestamp
inline constexpr double k_max_direction_change = 0.2;                      ///< +/- radians
inline constexpr types::value_range k_overshoot_distance{5.0, 15.0};      ///< px beyond the target
inline constexpr types::value_range k_overshoot_delay{0.05, 0.1};         ///< s after the target
inline constexpr types::value_range k_correction_delay{0.1, 0.2};         ///< s after the overshoot
inline constexpr double k_correction_extent = 2.0;                         ///< +/- px around the target

///
/// Counts of the perturbations applied by one run of the characteristics stage.
///
struct characteristics_report {
    std::size_t micro_corrections{0};
    std::size_t pauses{0};
    std::size_t direction_changes{0};
    bool overshoot{false};
};

///
/// Perturbs a skeleton with human-like imperfections.
///
/// Each point after the first independently receives, with the configured
/// probabilities, a micro-correction of up to k_micro_correction_extent px per
/// axis, a pause that delays its timestamp, and a small rotation of its
/// displacement from the previously processed point. Because the rotation pivots
/// on the already-perturbed predecessor, heading jitter accumulates along the path.
/// The first point is left untouched so that the trajectory begins exactly at the
/// requested start.
///
/// Afterwards, with overshoot_probability and only if more than four points
/// exist, an overshoot-and-correct tail is appended (see append_overshoot).
///
/// Sequences of fewer than three points are returned unchanged.
///
/// @param points Skeleton points
/// @param cfg Generator configuration
/// @param rng Random source
/// @param report Optional sink for counts of applied perturbations
/// @return Perturbed points with zero velocity and acceleration
///
std::vector<types::point> inject_human_characteristics(std::vector<types::point> points,
                                                       const generator_config& cfg,
                                                       random_source& rng,
                                                       characteristics_report* report = nullptr);

///
/// Appends an overshoot point beyond the last point and a correction point back near it.
///
/// The overshoot lies k_overshoot_distance px beyond the last point, along the
/// direction from the second-to-last point. The correction lands within
/// k_correction_extent px of the last point. Both are timestamped after the last
/// point. Nothing is appended if the last two points coincide.
///
/// @param points Points to extend; must hold at least two points
/// @param rng Random source
/// @return True if the tail was appended
/// @throws std::invalid_argument if points holds fewer than two points
///
bool append_overshoot(std::vector<types::point>& points, random_source& rng);

}  // namespace handpath::synth
