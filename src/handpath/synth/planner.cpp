#include <handpath/synth/planner.hpp>

#include <cmath>
#include <stdexcept>

namespace handpath::synth {

std::string_view to_string(skeleton_style style) noexcept {
    switch (style) {
        case skeleton_style::k_bezier:
            return "bezier";
        case skeleton_style::k_arc:
            return "arc";
        case skeleton_style::k_curved_direct:
            return "curved_direct";
    }
    return "unknown";
}

double derive_duration(double distance, const generator_config& cfg, random_source& rng) {
    const double base_speed = rng.uniform(cfg.avg_speed_range);
    double duration = distance / base_speed;

    if (distance > 500.0) {
        duration *= rng.uniform(1.1, 1.3);
    } else if (distance < 100.0) {
        duration *= rng.uniform(0.8, 1.0);
    }

    duration *= rng.uniform(cfg.speed_variation_range);
    return k_duration_bounds.clamp(duration);
}

skeleton_style choose_style(double distance, random_source& rng) {
    const auto& weights = (distance > k_long_distance) ? k_long_distance_style_weights : k_short_distance_style_weights;
    return static_cast<skeleton_style>(rng.weighted_index(weights));
}

motion_plan plan_motion(types::point2d start,
                        types::point2d end,
                        std::optional<double> duration,
                        const generator_config& cfg,
                        random_source& rng) {
    if (duration && (!std::isfinite(*duration) || *duration <= 0.0)) {
        throw std::invalid_argument{"duration must be positive and finite"};
    }

    const double distance = types::distance(start, end);
    const bool derived = !duration.has_value();
    const double planned = derived ? derive_duration(distance, cfg, rng) : k_duration_bounds.clamp(*duration);

    return {
        .distance = distance,
        .duration = planned,
        .style = choose_style(distance, rng),
        .derived_duration = derived,
    };
}

}  // namespace handpath::synth
