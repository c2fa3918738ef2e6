#pragma once

#include <cstddef>

#include <handpath/types/probability.hpp>
#include <handpath/types/value_range.hpp>

namespace handpath::synth {

///
/// Tunables shared read-only by every pipeline stage.
///
/// Owned by the caller and never mutated by the pipeline. All members carry
/// defaults, so a default-constructed config is a valid, typical configuration.
///
/// @code
///   generator_config cfg{.base_noise_amplitude = 1.0, .max_acceleration = 600.0};
///   cfg.validate();
/// @endcode
///
struct generator_config {
    ///
    /// Standard deviation scale of the speed-adaptive positional noise (px).
    ///
    double base_noise_amplitude{2.0};

    ///
    /// Per-point chance of rotating the local heading slightly.
    ///
    types::probability direction_change_probability{0.15};

    ///
    /// Per-point chance of a small positional micro-correction.
    ///
    types::probability micro_correction_probability{0.25};

    ///
    /// Per-point chance of delaying the point's timestamp (hesitation).
    ///
    types::probability pause_probability{0.08};

    ///
    /// Whole-trajectory chance of overshooting the target and correcting back.
    ///
    types::probability overshoot_probability{0.12};

    ///
    /// Multiplier range applied to a derived duration to vary movement tempo.
    ///
    types::value_range speed_variation_range{0.7, 1.4};

    ///
    /// Range from which the base pointer speed is sampled (px/s).
    ///
    types::value_range avg_speed_range{150.0, 400.0};

    ///
    /// Acceleration magnitude above which the validator damps a point (px/s^2).
    ///
    double max_acceleration{800.0};

    ///
    /// Minimum spacing between consecutive timestamps after validation (s).
    ///
    double min_time_interval{0.008};

    ///
    /// Nominal upper bound on the spacing between consecutive samples (s).
    ///
    double max_time_interval{0.025};

    ///
    /// Bezier control point offset as a fraction of the start-end distance.
    ///
    double bezier_control_range{0.3};

    ///
    /// Gaps longer than this multiple of max_time_interval are repaired.
    ///
    double max_gap_multiple{3.0};

    ///
    /// Hard cap on the number of points a single call may emit.
    ///
    std::size_t max_trajectory_points{130};

    ///
    /// Smallest admissible value for max_trajectory_points: the longest skeleton
    /// plus the two points of an overshoot tail.
    ///
    static constexpr std::size_t k_min_point_budget = 103;

    ///
    /// Checks the configuration for internal consistency.
    ///
    /// @throws std::invalid_argument naming the first offending field
    ///
    void validate() const;
};

}  // namespace handpath::synth
