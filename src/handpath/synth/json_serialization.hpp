#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include <handpath/synth/config.hpp>
#include <handpath/synth/observers.hpp>
#include <handpath/types/trajectory.hpp>

namespace handpath::synth {

///
/// Serializes a trajectory to JSON.
///
/// Points are stored as a struct of arrays. Times are relative to the first point;
/// the absolute basis is kept in metadata.
///
/// JSON structure:
/// @code{.json}
/// {
///   "metadata": {
///     "num_points": <int>,
///     "start_timestamp": <number>,
///     "elapsed": <number>,
///     "displacement": <number>,
///     "path_length": <number>,
///     "average_speed": <number>,
///     "peak_acceleration": <number>
///   },
///   "points": {
///     "time": [<number>, ...],
///     "x": [<number>, ...],
///     "y": [<number>, ...],
///     "velocity_x": [<number>, ...],
///     "velocity_y": [<number>, ...],
///     "acceleration_x": [<number>, ...],
///     "acceleration_y": [<number>, ...]
///   }
/// }
/// @endcode
///
/// @param traj The trajectory to serialize
/// @return JSON string
///
std::string serialize_trajectory_to_json(const types::trajectory& traj);

///
/// Serializes a trajectory together with the pipeline events that produced it.
///
/// Adds to the layout above:
/// @code{.json}
///   "events": {
///     "short_trajectory": {"distance": <number>} | null,
///     "plan": {"distance": <number>, "duration": <number>, "style": <string>, "derived_duration": <bool>} | null,
///     "characteristics": {"micro_corrections": <int>, "pauses": <int>, "direction_changes": <int>, "overshoot": <bool>} | null,
///     "validation": {"clamped_timestamps": <int>, "damped_accelerations": <int>,
///                    "residual_accelerations": <int>, "repaired_gaps": <int>,
///                    "unrepaired_gaps": <int>, "synthesized_points": <int>} | null,
///     "stage_point_counts": {"skeleton": <int>, "characteristics": <int>, "smoothing": <int>, "validation": <int>}
///   }
/// @endcode
///
/// @param traj The trajectory to serialize
/// @param collector Event collector that observed the generation of traj
/// @return JSON string
///
std::string serialize_trajectory_to_json(const types::trajectory& traj, const generation_event_collector& collector);

///
/// Writes trajectory JSON directly to an output stream.
///
/// @param out Output stream to write to
/// @param traj The trajectory to serialize
///
void write_trajectory_json(std::ostream& out, const types::trajectory& traj);

///
/// Serializes a generator configuration to JSON.
///
/// Scalars and probabilities are numbers; ranges are two-element arrays [lower, upper].
///
std::string config_to_json(const generator_config& cfg);

///
/// Parses a generator configuration from JSON.
///
/// Keys match the generator_config member names. Absent keys keep their defaults.
///
/// @param json JSON object text
/// @return Validated configuration
/// @throws std::invalid_argument on malformed JSON, unknown keys, wrongly typed
///         values, or a configuration that fails validation
///
generator_config config_from_json(std::string_view json);

}  // namespace handpath::synth
