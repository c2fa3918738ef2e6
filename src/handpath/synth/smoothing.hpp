#pragma once

#include <vector>

#include <handpath/synth/config.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>
#include <handpath/types/value_range.hpp>

namespace handpath::synth {

///
/// Speed (px/s) at which the noise factor equals one.
///
inline constexpr double k_noise_reference_speed = 200.0;

///
/// Bounds on the multiplier applied to base_noise_amplitude.
///
inline constexpr types::value_range k_noise_factor_bounds{0.5, 2.0};

///
/// Recomputes velocity and acceleration by backward finite differences.
///
/// Velocity of point i >= 1 is its displacement from point i - 1 over their time
/// difference; acceleration of point i >= 2 is the change of velocity over the same
/// time difference. Where the time difference is not positive the derivative stays
/// zero. The first point keeps zero velocity, the first two zero acceleration.
///
/// @param points Points to update in place
///
void derive_kinematics(std::vector<types::point>& points) noexcept;

///
/// Noise multiplier for a given speed: speed / k_noise_reference_speed clamped
/// into k_noise_factor_bounds.
///
double noise_factor(double speed) noexcept;

///
/// Derives kinematics and adds speed-adaptive Gaussian noise to every point but the first.
///
/// The noise on each axis is zero-mean with standard deviation
/// base_noise_amplitude * noise_factor(speed). Velocity and acceleration are those
/// of the positions before noise; they are not recomputed afterwards.
///
/// Sequences of fewer than three points are returned unchanged.
///
/// @param points Points from the characteristics stage
/// @param cfg Generator configuration
/// @param rng Random source
/// @return Noisy points carrying their pre-noise derivatives
///
std::vector<types::point> apply_smoothing_and_noise(std::vector<types::point> points, const generator_config& cfg, random_source& rng);

}  // namespace handpath::synth
