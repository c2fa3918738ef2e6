#include "test_utils.hpp"

#include <algorithm>
#include <limits>

namespace handpath::synth::test {

std::vector<types::point> make_line(types::point2d start, types::point2d end, std::size_t n_points, double t0, double dt) {
    std::vector<types::point> points;
    points.reserve(n_points);
    for (std::size_t i = 0; i < n_points; ++i) {
        const double t = (n_points > 1) ? static_cast<double>(i) / static_cast<double>(n_points - 1) : 0.0;
        points.push_back({
            .x = start.x + (end.x - start.x) * t,
            .y = start.y + (end.y - start.y) * t,
            .timestamp = t0 + dt * static_cast<double>(i),
        });
    }
    return points;
}

generator_config quiet_config() {
    return {
        .direction_change_probability = types::probability{0.0},
        .micro_correction_probability = types::probability{0.0},
        .pause_probability = types::probability{0.0},
        .overshoot_probability = types::probability{0.0},
    };
}

double min_time_step(const std::vector<types::point>& points) {
    double result = std::numeric_limits<double>::infinity();
    for (std::size_t i = 1; i < points.size(); ++i) {
        result = std::min(result, points[i].timestamp - points[i - 1].timestamp);
    }
    return result;
}

double max_time_step(const std::vector<types::point>& points) {
    double result = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        result = std::max(result, points[i].timestamp - points[i - 1].timestamp);
    }
    return result;
}

std::size_t count_above_acceleration(const std::vector<types::point>& points, double cap) {
    return static_cast<std::size_t>(
        std::ranges::count_if(points, [cap](const types::point& p) { return types::acceleration_magnitude(p) > cap; }));
}

}  // namespace handpath::synth::test
