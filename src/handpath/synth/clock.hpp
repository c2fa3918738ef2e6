#pragma once

#include <functional>

namespace handpath::synth {

///
/// Source of the timestamp basis for a generated trajectory, in seconds.
///
/// Read exactly once per generator call. Inject a fixed clock to make absolute
/// timestamps reproducible.
///
using clock = std::function<double()>;

///
/// Clock reading std::chrono::system_clock as seconds since the epoch.
///
clock system_clock();

///
/// Clock that always reports the given time.
///
/// @param t Time in seconds
///
clock fixed_clock(double t);

}  // namespace handpath::synth
