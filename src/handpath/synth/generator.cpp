#include <handpath/synth/generator.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <handpath/synth/characteristics.hpp>
#include <handpath/synth/planner.hpp>
#include <handpath/synth/skeleton.hpp>
#include <handpath/synth/smoothing.hpp>
#include <handpath/synth/validator.hpp>

namespace handpath::synth {

namespace {

void require_finite(types::point2d p, const char* name) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
        throw std::invalid_argument{std::string{name} + " coordinates must be finite"};
    }
}

void notify(generation_observer* observer, generation_observer::event ev) {
    if (observer) {
        observer->on_event(std::move(ev));
    }
}

}  // namespace

trajectory_generator::trajectory_generator() : trajectory_generator(options{}) {}

trajectory_generator::trajectory_generator(options opts) : options_{std::move(opts)} {
    options_.config.validate();
    if (!options_.clock) {
        throw std::invalid_argument{"trajectory_generator requires a clock"};
    }
}

types::trajectory trajectory_generator::generate(types::point2d start,
                                                 types::point2d end,
                                                 std::optional<double> duration,
                                                 random_source& rng) const {
    require_finite(start, "start");
    require_finite(end, "end");
    if (duration && (!std::isfinite(*duration) || *duration <= 0.0)) {
        throw std::invalid_argument{"duration must be positive and finite"};
    }

    const auto& cfg = options_.config;
    auto* const observer = options_.observer;
    const double t0 = options_.clock();

    const double distance = types::distance(start, end);
    if (distance < k_short_distance_threshold) {
        notify(observer, generation_observer::short_trajectory_event{distance});
        return types::trajectory{generate_short_trajectory(start, end, t0, rng)};
    }

    const auto plan = plan_motion(start, end, duration, cfg, rng);
    notify(observer, generation_observer::planned_event{plan});

    auto points = generate_skeleton(start, end, plan, t0, cfg, rng);
    notify(observer, generation_observer::skeleton_event{plan.style, points.size()});

    characteristics_report characteristics;
    points = inject_human_characteristics(std::move(points), cfg, rng, &characteristics);
    notify(observer, generation_observer::characteristics_event{characteristics, points.size()});

    points = apply_smoothing_and_noise(std::move(points), cfg, rng);
    notify(observer, generation_observer::smoothing_event{points.size()});

    validation_report validation;
    points = validate_trajectory(std::move(points), cfg, rng, &validation);
    notify(observer, generation_observer::validation_event{validation, points.size()});

    return types::trajectory{std::move(points)};
}

const generator_config& trajectory_generator::config() const noexcept {
    return options_.config;
}

std::vector<types::point> generate_short_trajectory(types::point2d start, types::point2d end, double t0, random_source& rng) {
    std::vector<types::point> points;
    points.reserve(2);
    points.push_back({.x = start.x, .y = start.y, .timestamp = t0});
    points.push_back({
        .x = end.x + rng.uniform(-1.0, 1.0),
        .y = end.y + rng.uniform(-1.0, 1.0),
        .timestamp = t0 + rng.uniform(0.1, 0.3),
    });
    return points;
}

}  // namespace handpath::synth
