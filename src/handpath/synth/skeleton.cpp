#include <handpath/synth/skeleton.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <boost/numeric/conversion/cast.hpp>

namespace handpath::synth {

namespace {

Eigen::Vector2d to_vector(types::point2d p) {
    return {p.x, p.y};
}

// Samples a curve over t = i / n for i in [0, n], mapping t to a timestamp on
// [t0, t0 + duration].
template <typename Curve>
std::vector<types::point> sample_curve(std::size_t n, double t0, double duration, Curve&& curve) {
    std::vector<types::point> points;
    points.reserve(n + 1);
    for (std::size_t i = 0; i <= n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n);
        const Eigen::Vector2d p = curve(t);
        points.push_back({.x = p.x(), .y = p.y(), .timestamp = t0 + t * duration});
    }
    return points;
}

std::vector<types::point> bezier_skeleton(const Eigen::Vector2d& a,
                                          const Eigen::Vector2d& b,
                                          const motion_plan& plan,
                                          double t0,
                                          const generator_config& cfg,
                                          random_source& rng) {
    const Eigen::Vector2d mid = (a + b) / 2.0;
    const double offset = plan.distance * cfg.bezier_control_range;

    const Eigen::Vector2d c1 = mid + Eigen::Vector2d{rng.uniform(-offset, offset), rng.uniform(-offset, offset)};

    if (rng.chance(types::probability{0.6})) {
        // The second control point stays closer to the midpoint than the first.
        const double half = offset / 2.0;
        const Eigen::Vector2d c2 = mid + Eigen::Vector2d{rng.uniform(-half, half), rng.uniform(-half, half)};
        const auto n = sample_interval_count(plan.duration, cfg, rng);
        return sample_curve(n, t0, plan.duration, [&](double t) { return cubic_bezier(a, c1, c2, b, t); });
    }

    const auto n = sample_interval_count(plan.duration, cfg, rng);
    return sample_curve(n, t0, plan.duration, [&](double t) { return quadratic_bezier(a, c1, b, t); });
}

std::vector<types::point> arc_skeleton(const Eigen::Vector2d& a,
                                       const Eigen::Vector2d& b,
                                       const motion_plan& plan,
                                       double t0,
                                       const generator_config& cfg,
                                       random_source& rng) {
    const Eigen::Vector2d delta = b - a;

    double arc_height = rng.uniform(plan.distance * 0.1, plan.distance * 0.3);
    if (rng.chance(types::probability{0.5})) {
        arc_height = -arc_height;
    }

    // Bow across the dominant axis of travel.
    const Eigen::Vector2d bow = (std::abs(delta.x()) > std::abs(delta.y())) ? Eigen::Vector2d::UnitY() : Eigen::Vector2d::UnitX();

    const auto n = sample_interval_count(plan.duration, cfg, rng);
    return sample_curve(n, t0, plan.duration, [&](double t) -> Eigen::Vector2d {
        return a + delta * t + bow * (arc_height * std::sin(std::numbers::pi * t));
    });
}

std::vector<types::point> curved_direct_skeleton(const Eigen::Vector2d& a,
                                                 const Eigen::Vector2d& b,
                                                 const motion_plan& plan,
                                                 double t0,
                                                 const generator_config& cfg,
                                                 random_source& rng) {
    const Eigen::Vector2d delta = b - a;
    const auto n = sample_interval_count(plan.duration, cfg, rng);
    return sample_curve(n, t0, plan.duration, [&](double t) -> Eigen::Vector2d { return a + delta * ease_in_out_cubic(t); });
}

}  // namespace

std::size_t sample_interval_count(double duration, const generator_config& cfg, random_source& rng) {
    const double interval = rng.uniform(cfg.min_time_interval, cfg.max_time_interval);
    const double putative = std::clamp(std::floor(duration / interval),
                                       static_cast<double>(k_min_skeleton_intervals),
                                       static_cast<double>(k_max_skeleton_intervals));
    return boost::numeric_cast<std::size_t>(putative);
}

double ease_in_out_cubic(double t) noexcept {
    if (t < 0.5) {
        return 4.0 * t * t * t;
    }
    const double u = -2.0 * t + 2.0;
    return 1.0 - (u * u * u) / 2.0;
}

Eigen::Vector2d quadratic_bezier(const Eigen::Vector2d& p0, const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, double t) noexcept {
    const double u = 1.0 - t;
    return (u * u) * p0 + (2.0 * u * t) * p1 + (t * t) * p2;
}

Eigen::Vector2d cubic_bezier(
    const Eigen::Vector2d& p0, const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, const Eigen::Vector2d& p3, double t) noexcept {
    const double u = 1.0 - t;
    return (u * u * u) * p0 + (3.0 * u * u * t) * p1 + (3.0 * u * t * t) * p2 + (t * t * t) * p3;
}

std::vector<types::point> generate_skeleton(
    types::point2d start, types::point2d end, const motion_plan& plan, double t0, const generator_config& cfg, random_source& rng) {
    const Eigen::Vector2d a = to_vector(start);
    const Eigen::Vector2d b = to_vector(end);

    auto points = [&] {
        switch (plan.style) {
            case skeleton_style::k_bezier:
                return bezier_skeleton(a, b, plan, t0, cfg, rng);
            case skeleton_style::k_arc:
                return arc_skeleton(a, b, plan, t0, cfg, rng);
            case skeleton_style::k_curved_direct:
                return curved_direct_skeleton(a, b, plan, t0, cfg, rng);
        }
        throw std::invalid_argument("unknown skeleton_style");
    }();

    // Endpoints are exact, not a rounding error away.
    points.front().x = start.x;
    points.front().y = start.y;
    points.back().x = end.x;
    points.back().y = end.y;

    return points;
}

}  // namespace handpath::synth
