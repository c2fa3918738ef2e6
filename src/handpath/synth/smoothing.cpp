#include <handpath/synth/smoothing.hpp>

namespace handpath::synth {

void derive_kinematics(std::vector<types::point>& points) noexcept {
    for (auto& p : points) {
        p.velocity_x = p.velocity_y = 0.0;
        p.acceleration_x = p.acceleration_y = 0.0;
    }

    for (std::size_t i = 1; i < points.size(); ++i) {
        const double dt = points[i].timestamp - points[i - 1].timestamp;
        if (dt > 0.0) {
            points[i].velocity_x = (points[i].x - points[i - 1].x) / dt;
            points[i].velocity_y = (points[i].y - points[i - 1].y) / dt;
        }
    }

    for (std::size_t i = 2; i < points.size(); ++i) {
        const double dt = points[i].timestamp - points[i - 1].timestamp;
        if (dt > 0.0) {
            points[i].acceleration_x = (points[i].velocity_x - points[i - 1].velocity_x) / dt;
            points[i].acceleration_y = (points[i].velocity_y - points[i - 1].velocity_y) / dt;
        }
    }
}

double noise_factor(double speed) noexcept {
    return k_noise_factor_bounds.clamp(speed / k_noise_reference_speed);
}

std::vector<types::point> apply_smoothing_and_noise(std::vector<types::point> points, const generator_config& cfg, random_source& rng) {
    if (points.size() < 3) {
        return points;
    }

    derive_kinematics(points);

    for (std::size_t i = 1; i < points.size(); ++i) {
        auto& p = points[i];
        const double sigma = cfg.base_noise_amplitude * noise_factor(types::speed(p));
        p.x += rng.gaussian(0.0, sigma);
        p.y += rng.gaussian(0.0, sigma);
    }

    return points;
}

}  // namespace handpath::synth
