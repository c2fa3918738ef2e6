#include <handpath/synth/characteristics.hpp>

#include <stdexcept>
#include <utility>

#include <Eigen/Geometry>

namespace handpath::synth {

std::vector<types::point> inject_human_characteristics(std::vector<types::point> points,
                                                       const generator_config& cfg,
                                                       random_source& rng,
                                                       characteristics_report* report) {
    characteristics_report local;
    if (points.size() < 3) {
        if (report) {
            *report = local;
        }
        return points;
    }

    std::vector<types::point> enhanced;
    enhanced.reserve(points.size() + 2);
    // The first point takes no micro-correction, so the path starts exactly at the requested start.
    enhanced.push_back({.x = points.front().x, .y = points.front().y, .timestamp = points.front().timestamp});

    for (std::size_t i = 1; i < points.size(); ++i) {
        types::point current{.x = points[i].x, .y = points[i].y, .timestamp = points[i].timestamp};

        if (rng.chance(cfg.micro_correction_probability)) {
            current.x += rng.uniform(-k_micro_correction_extent, k_micro_correction_extent);
            current.y += rng.uniform(-k_micro_correction_extent, k_micro_correction_extent);
            ++local.micro_corrections;
        }

        if (rng.chance(cfg.pause_probability)) {
            current.timestamp += rng.uniform(k_pause_duration);
            ++local.pauses;
        }

        if (rng.chance(cfg.direction_change_probability)) {
            const auto& previous = enhanced.back();
            const Eigen::Rotation2Dd rotation{rng.uniform(-k_max_direction_change, k_max_direction_change)};
            const Eigen::Vector2d heading = rotation * Eigen::Vector2d{current.x - previous.x, current.y - previous.y};
            current.x = previous.x + heading.x();
            current.y = previous.y + heading.y();
            ++local.direction_changes;
        }

        enhanced.push_back(current);
    }

    if (rng.chance(cfg.overshoot_probability) && enhanced.size() > 4) {
        local.overshoot = append_overshoot(enhanced, rng);
    }

    if (report) {
        *report = local;
    }
    return enhanced;
}

bool append_overshoot(std::vector<types::point>& points, random_source& rng) {
    if (points.size() < 2) {
        throw std::invalid_argument{"overshoot requires at least two points"};
    }

    const auto& target = points.back();
    const auto& pre_target = points[points.size() - 2];

    const double reach = rng.uniform(k_overshoot_distance);
    const Eigen::Vector2d approach{target.x - pre_target.x, target.y - pre_target.y};
    const double approach_length = approach.norm();
    if (approach_length <= 0.0) {
        return false;
    }

    const Eigen::Vector2d beyond = Eigen::Vector2d{target.x, target.y} + approach / approach_length * reach;
    const types::point overshoot{
        .x = beyond.x(),
        .y = beyond.y(),
        .timestamp = target.timestamp + rng.uniform(k_overshoot_delay),
    };
    const types::point correction{
        .x = target.x + rng.uniform(-k_correction_extent, k_correction_extent),
        .y = target.y + rng.uniform(-k_correction_extent, k_correction_extent),
        .timestamp = overshoot.timestamp + rng.uniform(k_correction_delay),
    };

    // The references into points are dead once we push.
    points.push_back(overshoot);
    points.push_back(correction);
    return true;
}

}  // namespace handpath::synth
