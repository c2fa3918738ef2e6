#pragma once

#include <algorithm>

namespace handpath::types {

///
/// Closed interval [lower, upper] of a scalar tunable.
///
struct value_range {
    double lower;  ///< Inclusive lower bound
    double upper;  ///< Inclusive upper bound

    ///
    /// Checks that the interval is not inverted.
    ///
    constexpr bool ordered() const noexcept {
        return lower <= upper;
    }

    ///
    /// Checks whether a value lies within the interval.
    ///
    constexpr bool contains(double v) const noexcept {
        return v >= lower && v <= upper;
    }

    ///
    /// Clamps a value into the interval.
    ///
    /// @note The interval must be ordered.
    ///
    constexpr double clamp(double v) const noexcept {
        return std::clamp(v, lower, upper);
    }
};

}  // namespace handpath::types
