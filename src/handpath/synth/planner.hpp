#pragma once

#include <array>
#include <optional>
#include <string_view>

#include <handpath/synth/config.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>
#include <handpath/types/value_range.hpp>

namespace handpath::synth {

///
/// Geometric family of the noise-free skeleton path.
///
enum class skeleton_style {
    k_bezier,
    k_arc,
    k_curved_direct,
};

///
/// Human-readable name of a skeleton style.
///
std::string_view to_string(skeleton_style style) noexcept;

///
/// Output of the planning stage, consumed by the skeleton generator.
///
struct motion_plan {
    double distance;        ///< Start-to-end distance (px)
    double duration;        ///< Target movement duration (s), within k_duration_bounds
    skeleton_style style;   ///< Skeleton family to draw
    bool derived_duration;  ///< True if the duration was sampled rather than supplied
};

///
/// Moves shorter than this bypass the pipeline in favour of a two-point trajectory.
///
inline constexpr double k_short_distance_threshold = 5.0;

///
/// Every planned duration is clamped into this range (s).
///
inline constexpr types::value_range k_duration_bounds{0.2, 3.0};

///
/// Above this distance the skeleton style weights favour Bezier curves.
///
inline constexpr double k_long_distance = 300.0;

///
/// Style weights in skeleton_style order, for long and for short moves.
///
inline constexpr std::array<double, 3> k_long_distance_style_weights{0.5, 0.3, 0.2};
inline constexpr std::array<double, 3> k_short_distance_style_weights{0.3, 0.2, 0.5};

///
/// Samples a plausible movement duration for a distance.
///
/// Divides the distance by a speed sampled from avg_speed_range, slows long moves
/// (> 500 px) by 1.1-1.3x, quickens short ones (< 100 px) by 0.8-1.0x, applies a
/// random tempo variation from speed_variation_range and clamps the result into
/// k_duration_bounds.
///
/// @param distance Distance to travel (px)
/// @param cfg Generator configuration
/// @param rng Random source
/// @return Duration in seconds
///
double derive_duration(double distance, const generator_config& cfg, random_source& rng);

///
/// Chooses a skeleton style, weighted by distance.
///
skeleton_style choose_style(double distance, random_source& rng);

///
/// Plans a movement from start to end.
///
/// @param start Start position
/// @param end End position
/// @param duration Caller-supplied duration (s); sampled if absent
/// @param cfg Generator configuration
/// @param rng Random source
/// @return The plan; a supplied duration is clamped into k_duration_bounds
/// @throws std::invalid_argument if a supplied duration is not finite or not positive
///
motion_plan plan_motion(types::point2d start,
                        types::point2d end,
                        std::optional<double> duration,
                        const generator_config& cfg,
                        random_source& rng);

}  // namespace handpath::synth
