#pragma once

#include <optional>
#include <vector>

#include <handpath/synth/clock.hpp>
#include <handpath/synth/config.hpp>
#include <handpath/synth/observers.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/types/point.hpp>
#include <handpath/types/trajectory.hpp>

namespace handpath::synth {

///
/// Synthesizes human-like pointer trajectories.
///
/// Runs the five-stage pipeline (planner, skeleton, characteristics, smoothing and
/// noise, validation) on each call. Holds no state between calls; the random
/// source is supplied per call, so one generator may serve concurrent callers as
/// long as each brings its own random_source.
///
/// @code
///   trajectory_generator gen{{.clock = fixed_clock(0.0)}};
///   random_source rng{42};
///   auto traj = gen.generate({100, 100}, {300, 300}, std::nullopt, rng);
/// @endcode
///
class trajectory_generator {
   public:
    ///
    /// Construction options.
    ///
    struct options {
        ///
        /// Pipeline tunables.
        ///
        generator_config config{};

        ///
        /// Timestamp basis, read once per generate() call.
        ///
        synth::clock clock = system_clock();

        ///
        /// Observer for pipeline events (optional, not owned).
        ///
        generation_observer* observer = nullptr;
    };

    ///
    /// Constructs a generator with default options.
    ///
    trajectory_generator();

    ///
    /// Constructs a generator.
    ///
    /// @param opts Options (moved into the generator)
    /// @throws std::invalid_argument if opts.config fails validation or opts.clock is empty
    ///
    explicit trajectory_generator(options opts);

    ///
    /// Generates a trajectory from start to end.
    ///
    /// Moves shorter than k_short_distance_threshold return the two-point trajectory
    /// of generate_short_trajectory() and skip the pipeline.
    ///
    /// @param start Start position
    /// @param end End position
    /// @param duration Target duration in seconds; sampled from the distance if absent
    /// @param rng Random source for every probabilistic decision of this call
    /// @return Trajectory whose first point is start, timestamped with the clock reading
    /// @throws std::invalid_argument if a coordinate is not finite, or if duration is
    ///         supplied and is not finite or not positive
    ///
    [[nodiscard]] types::trajectory generate(types::point2d start,
                                             types::point2d end,
                                             std::optional<double> duration,
                                             random_source& rng) const;

    ///
    /// Gets the configuration used by this generator.
    ///
    const generator_config& config() const noexcept;

   private:
    options options_;
};

///
/// Two-point trajectory for very short moves.
///
/// The first point is exactly start at t0; the second is end jittered by up to
/// 1 px per axis, 0.1-0.3 s later.
///
/// @param start Start position
/// @param end End position
/// @param t0 Timestamp basis (s)
/// @param rng Random source
///
std::vector<types::point> generate_short_trajectory(types::point2d start, types::point2d end, double t0, random_source& rng);

}  // namespace handpath::synth
