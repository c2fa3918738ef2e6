#include <handpath/synth/validator.hpp>

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace handpath::synth {

namespace {

// Pulls an accepted point halfway back toward its predecessor and rederives its
// kinematics. Returns false if the rederived acceleration still exceeds
// max_acceleration.
bool damp_acceleration(types::point& current, const types::point& previous, double max_acceleration) {
    current.x = (current.x + previous.x) / 2.0;
    current.y = (current.y + previous.y) / 2.0;

    const double dt = current.timestamp - previous.timestamp;
    if (dt <= 0.0) {
        current.velocity_x = current.velocity_y = 0.0;
        current.acceleration_x = current.acceleration_y = 0.0;
        return true;
    }

    const Eigen::Vector2d velocity = Eigen::Vector2d{current.x - previous.x, current.y - previous.y} / dt;
    const Eigen::Vector2d acceleration = (velocity - Eigen::Vector2d{previous.velocity_x, previous.velocity_y}) / dt;

    current.velocity_x = velocity.x();
    current.velocity_y = velocity.y();
    current.acceleration_x = acceleration.x();
    current.acceleration_y = acceleration.y();
    return acceleration.norm() <= max_acceleration;
}

// Fewest points that split a gap of dt seconds into steps no longer than gap_limit.
std::size_t required_count(double dt, double gap_limit) {
    return static_cast<std::size_t>(std::max(0.0, std::ceil(dt / gap_limit) - 1.0));
}

// reserved[i] is the budget kept back for the gaps after input point i. A repair
// can leave up to gap_limit between its last synthesized point and the dropped
// input point, so a later gap g may need up to required_count(g) points beyond
// its own slot.
std::vector<std::size_t> reserve_for_later_gaps(const std::vector<types::point>& points, double gap_limit) {
    std::vector<std::size_t> reserved(points.size(), 0);
    for (std::size_t i = points.size() - 1; i > 0; --i) {
        reserved[i - 1] = reserved[i] + required_count(points[i].timestamp - points[i - 1].timestamp, gap_limit);
    }
    return reserved;
}

// Number of points to synthesize across a gap of dt seconds. The gap is filled
// at max_time_interval spacing when the budget left over after the reserve
// allows it, otherwise with only as many points as gap_limit requires.
std::size_t intermediate_count(double dt, double gap_limit, const generator_config& cfg, std::size_t room, std::size_t reserve) {
    const auto natural = static_cast<std::size_t>(std::floor(dt / cfg.max_time_interval));
    const std::size_t spare = (room > reserve) ? room - reserve : 0;
    const std::size_t wanted = (spare >= natural) ? natural : std::max(required_count(dt, gap_limit), spare);

    // k points split the gap into k + 1 steps; keep each step >= min_time_interval.
    const auto spacing_limit = static_cast<std::size_t>(std::max(0.0, std::floor(dt / cfg.min_time_interval) - 1.0));

    return std::min({wanted, spacing_limit, room});
}

}  // namespace

std::vector<types::point> validate_trajectory(std::vector<types::point> points,
                                              const generator_config& cfg,
                                              random_source& rng,
                                              validation_report* report) {
    validation_report local;
    if (points.size() < 2) {
        if (report) {
            *report = local;
        }
        return points;
    }

    const double gap_limit = cfg.max_gap_multiple * cfg.max_time_interval;
    const auto reserved = reserve_for_later_gaps(points, gap_limit);

    std::vector<types::point> validated;
    validated.reserve(std::min(cfg.max_trajectory_points, points.size() * 2));
    validated.push_back(points.front());

    for (std::size_t i = 1; i < points.size(); ++i) {
        auto current = points[i];
        const auto previous = validated.back();
        const double dt = current.timestamp - previous.timestamp;

        if (dt < cfg.min_time_interval) {
            current.timestamp = previous.timestamp + cfg.min_time_interval;
            ++local.clamped_timestamps;
        } else if (dt > gap_limit) {
            // Every input point after this one may still be appended, so reserve a
            // slot for each. The current point is dropped if the gap is repaired.
            const std::size_t pending = points.size() - i - 1;
            const std::size_t used = validated.size() + pending;
            const std::size_t room = (cfg.max_trajectory_points > used) ? cfg.max_trajectory_points - used : 0;

            const std::size_t k = intermediate_count(dt, gap_limit, cfg, room, reserved[i]);
            if (k < required_count(dt, gap_limit)) {
                ++local.unrepaired_gaps;
            }
            if (k > 0) {
                for (std::size_t j = 1; j <= k; ++j) {
                    const double t = static_cast<double>(j) / static_cast<double>(k + 1);
                    validated.push_back({
                        .x = previous.x + (current.x - previous.x) * t + rng.uniform(-k_intermediate_jitter, k_intermediate_jitter),
                        .y = previous.y + (current.y - previous.y) * t + rng.uniform(-k_intermediate_jitter, k_intermediate_jitter),
                        .timestamp = previous.timestamp + dt * t,
                    });
                }
                ++local.repaired_gaps;
                local.synthesized_points += k;
                continue;
            }
        }

        if (types::acceleration_magnitude(current) > cfg.max_acceleration) {
            if (!damp_acceleration(current, previous, cfg.max_acceleration)) {
                ++local.residual_accelerations;
            }
            ++local.damped_accelerations;
        }

        validated.push_back(current);
    }

    if (report) {
        *report = local;
    }
    return validated;
}

}  // namespace handpath::synth
