#include <handpath/synth/config.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace handpath::synth {

namespace {

void require_positive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument{std::string{name} + " must be positive and finite"};
    }
}

void require_positive_range(const types::value_range& range, const char* name) {
    if (!std::isfinite(range.lower) || !std::isfinite(range.upper)) {
        throw std::invalid_argument{std::string{name} + " bounds must be finite"};
    }
    if (!range.ordered()) {
        throw std::invalid_argument{std::string{name} + " lower bound exceeds upper bound"};
    }
    if (range.lower <= 0.0) {
        throw std::invalid_argument{std::string{name} + " bounds must be positive"};
    }
}

}  // namespace

void generator_config::validate() const {
    if (!std::isfinite(base_noise_amplitude) || base_noise_amplitude < 0.0) {
        throw std::invalid_argument{"base_noise_amplitude must be non-negative and finite"};
    }
    if (!std::isfinite(bezier_control_range) || bezier_control_range < 0.0) {
        throw std::invalid_argument{"bezier_control_range must be non-negative and finite"};
    }

    require_positive_range(speed_variation_range, "speed_variation_range");
    require_positive_range(avg_speed_range, "avg_speed_range");

    require_positive(max_acceleration, "max_acceleration");
    require_positive(min_time_interval, "min_time_interval");
    require_positive(max_time_interval, "max_time_interval");
    if (min_time_interval > max_time_interval) {
        throw std::invalid_argument{"min_time_interval exceeds max_time_interval"};
    }

    if (!std::isfinite(max_gap_multiple) || max_gap_multiple < 1.0) {
        throw std::invalid_argument{"max_gap_multiple must be at least 1"};
    }
    if (max_trajectory_points < k_min_point_budget) {
        throw std::invalid_argument{"max_trajectory_points must be at least " + std::to_string(k_min_point_budget)};
    }
}

}  // namespace handpath::synth
