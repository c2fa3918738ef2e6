#pragma once

#include <cmath>
#include <stdexcept>

namespace handpath::types {

///
/// Strong type for a probability.
///
/// Prevents mixing chances with the plain scalars (pixels, seconds) that sit next
/// to them in the generator configuration.
///
struct probability {
    ///
    /// Probability value in [0, 1].
    ///
    double value;

    ///
    /// Constructs from a raw value.
    ///
    /// @param p Probability in [0, 1]
    /// @throws std::invalid_argument if p is not finite or lies outside [0, 1]
    ///
    explicit probability(double p) : value{p} {
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
            throw std::invalid_argument{"probability must lie in [0, 1]"};
        }
    }
};

}  // namespace handpath::types
