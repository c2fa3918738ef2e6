#include <handpath/synth/validator.hpp>

#include <cmath>
#include <cstdint>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <handpath/synth/smoothing.hpp>

#include "test_utils.hpp"

namespace {

using namespace handpath::synth;
using handpath::types::point;
using handpath::types::point2d;

}  // namespace

BOOST_AUTO_TEST_SUITE(validator_timing_tests)

BOOST_AUTO_TEST_CASE(single_point_passes_through) {
    const generator_config cfg;
    random_source rng{1};
    const std::vector<point> input{{.x = 1.0, .y = 2.0, .timestamp = 3.0}};
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);
    BOOST_REQUIRE_EQUAL(output.size(), 1U);
    BOOST_CHECK_EQUAL(output[0].timestamp, 3.0);
}

BOOST_AUTO_TEST_CASE(crowded_timestamps_are_stretched) {
    const generator_config cfg;
    random_source rng{2};

    const auto input = test::make_line(point2d{0.0, 0.0}, point2d{0.0, 0.0}, 4, 0.0, 0.001);
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_REQUIRE_EQUAL(output.size(), 4U);
    for (std::size_t i = 0; i < output.size(); ++i) {
        BOOST_CHECK_CLOSE(output[i].timestamp + 1.0, 1.0 + cfg.min_time_interval * static_cast<double>(i), 1e-9);
    }
    BOOST_CHECK_EQUAL(report.clamped_timestamps, 3U);
    BOOST_CHECK_EQUAL(report.repaired_gaps, 0U);
}

BOOST_AUTO_TEST_CASE(backwards_timestamps_are_stretched) {
    const generator_config cfg;
    random_source rng{3};

    const std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 1.0},
        {.x = 1.0, .y = 0.0, .timestamp = 0.5},
    };
    const auto output = validate_trajectory(input, cfg, rng);
    BOOST_REQUIRE_EQUAL(output.size(), 2U);
    BOOST_CHECK_CLOSE(output[1].timestamp, 1.0 + cfg.min_time_interval, 1e-9);
}

BOOST_AUTO_TEST_CASE(large_gap_is_filled_and_current_point_dropped) {
    const generator_config cfg;
    random_source rng{4};

    // 0.21 s gap: floor(0.21 / 0.025) = 8 points at fractions i / 9.
    const std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 90.0, .y = 0.0, .timestamp = 0.21},
    };
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_REQUIRE_EQUAL(output.size(), 9U);
    BOOST_CHECK_EQUAL(report.repaired_gaps, 1U);
    BOOST_CHECK_EQUAL(report.synthesized_points, 8U);

    for (std::size_t j = 1; j < output.size(); ++j) {
        const double fraction = static_cast<double>(j) / 9.0;
        BOOST_CHECK_CLOSE(output[j].timestamp, 0.21 * fraction, 1e-9);
        BOOST_CHECK_LE(std::abs(output[j].x - 90.0 * fraction), k_intermediate_jitter + 1e-9);
        BOOST_CHECK_LE(std::abs(output[j].y), k_intermediate_jitter + 1e-9);
    }

    // The far endpoint itself is not emitted.
    BOOST_CHECK_LT(output.back().timestamp, 0.21);
}

BOOST_AUTO_TEST_CASE(gap_too_short_to_split_is_kept) {
    // A 0.03 s gap exceeds the limit, but splitting it would undercut min_time_interval.
    const generator_config cfg{
        .min_time_interval = 0.02,
        .max_time_interval = 0.025,
        .max_gap_multiple = 1.0,
    };
    random_source rng{5};

    const std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 3.0, .y = 0.0, .timestamp = 0.03},
    };
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_REQUIRE_EQUAL(output.size(), 2U);
    BOOST_CHECK_EQUAL(output[1].x, 3.0);
    BOOST_CHECK_EQUAL(output[1].timestamp, 0.03);
    BOOST_CHECK_EQUAL(report.repaired_gaps, 0U);
    BOOST_CHECK_EQUAL(report.unrepaired_gaps, 1U);
}

BOOST_AUTO_TEST_CASE(point_budget_caps_gap_repair) {
    const generator_config cfg{.max_trajectory_points = generator_config::k_min_point_budget};
    random_source rng{6};

    // One long stall after the first point, then a steady stream filling the budget.
    std::vector<point> input{{.x = 0.0, .y = 0.0, .timestamp = 0.0}};
    for (std::size_t i = 1; i < cfg.max_trajectory_points; ++i) {
        input.push_back({.x = static_cast<double>(i), .y = 0.0, .timestamp = 1.0 + 0.01 * static_cast<double>(i - 1)});
    }

    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_CHECK_LE(output.size(), cfg.max_trajectory_points);
    BOOST_CHECK_GE(report.repaired_gaps, 1U);
    BOOST_CHECK_EQUAL(report.unrepaired_gaps, 1U);
    BOOST_CHECK_GE(test::min_time_step(output), cfg.min_time_interval - 1e-9);
}

BOOST_AUTO_TEST_CASE(budget_is_shared_between_gaps) {
    const generator_config cfg{.max_trajectory_points = generator_config::k_min_point_budget};
    const double gap_limit = cfg.max_gap_multiple * cfg.max_time_interval;
    random_source rng{8};

    // 90 points 10 ms apart, with six 280 ms stalls. Filling the first stalls at
    // max_time_interval spacing would leave nothing for the later ones.
    std::vector<point> input;
    double t = 0.0;
    for (std::size_t i = 0; i < 90; ++i) {
        if (i > 0) {
            t += (i % 15 == 10) ? 0.28 : 0.01;
        }
        input.push_back({.x = static_cast<double>(i), .y = 0.0, .timestamp = t});
    }

    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_CHECK_LE(output.size(), cfg.max_trajectory_points);
    BOOST_CHECK_GE(report.repaired_gaps, 6U);
    BOOST_CHECK_EQUAL(report.unrepaired_gaps, 0U);
    BOOST_CHECK_LE(test::max_time_step(output), gap_limit + 1e-9);
    BOOST_CHECK_GE(test::min_time_step(output), cfg.min_time_interval - 1e-9);
}

BOOST_AUTO_TEST_CASE(spare_budget_fills_gap_at_max_interval) {
    const generator_config cfg;
    random_source rng{9};

    // Two 0.2 s stalls in a short input: both get floor(0.2 / 0.025) = 8 points.
    const std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 10.0, .y = 0.0, .timestamp = 0.2},
        {.x = 11.0, .y = 0.0, .timestamp = 0.21},
        {.x = 20.0, .y = 0.0, .timestamp = 0.41},
    };
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_CHECK_EQUAL(report.repaired_gaps, 2U);
    BOOST_CHECK_EQUAL(report.unrepaired_gaps, 0U);
    BOOST_CHECK_GE(report.synthesized_points, 16U);
    BOOST_CHECK_LE(test::max_time_step(output), cfg.max_gap_multiple * cfg.max_time_interval + 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(validator_acceleration_tests)

BOOST_AUTO_TEST_CASE(jerk_is_damped_toward_previous_point) {
    const generator_config cfg;
    random_source rng{7};

    std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 1.0, .y = 0.0, .timestamp = 0.01},
        {.x = 50.0, .y = 0.0, .timestamp = 0.02},
    };
    derive_kinematics(input);

    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_REQUIRE_EQUAL(output.size(), 3U);
    BOOST_CHECK_EQUAL(report.damped_accelerations, 1U);
    BOOST_CHECK_CLOSE(output[2].x, 25.5, 1e-9);
    BOOST_CHECK_CLOSE(output[2].velocity_x, 2450.0, 1e-6);

    // Acceleration is rederived from the damped position: (2450 - 100) / 0.01.
    BOOST_CHECK_CLOSE(output[2].acceleration_x, 235000.0, 1e-6);
    BOOST_CHECK_EQUAL(output[2].acceleration_y, 0.0);
    BOOST_CHECK_EQUAL(report.residual_accelerations, 1U);
}

BOOST_AUTO_TEST_CASE(mild_jerk_is_damped_within_cap) {
    const generator_config cfg;
    random_source rng{10};

    // Stored acceleration 1000 px/s^2 trips the check; halving the step brings the
    // rederived acceleration to (10 - 20) / 0.05 = -200 px/s^2.
    const std::vector<point> input{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0, .velocity_x = 20.0},
        {.x = 1.0, .y = 0.0, .timestamp = 0.05, .velocity_x = 20.0, .acceleration_x = 1000.0},
    };
    validation_report report;
    const auto output = validate_trajectory(input, cfg, rng, &report);

    BOOST_REQUIRE_EQUAL(output.size(), 2U);
    BOOST_CHECK_EQUAL(report.damped_accelerations, 1U);
    BOOST_CHECK_EQUAL(report.residual_accelerations, 0U);
    BOOST_CHECK_CLOSE(output[1].x, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(output[1].velocity_x, 10.0, 1e-9);
    BOOST_CHECK_CLOSE(output[1].acceleration_x, -200.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(only_residual_points_exceed_acceleration_cap) {
    const generator_config cfg;
    for (std::uint64_t seed = 0; seed < 25; ++seed) {
        random_source rng{seed};

        // Jagged input with large finite-difference accelerations.
        std::vector<point> input;
        for (int i = 0; i < 60; ++i) {
            input.push_back({
                .x = 5.0 * i + rng.uniform(-4.0, 4.0),
                .y = rng.uniform(-4.0, 4.0),
                .timestamp = 0.015 * i + rng.uniform(0.0, 0.004),
            });
        }
        derive_kinematics(input);

        validation_report report;
        const auto output = validate_trajectory(input, cfg, rng, &report);
        BOOST_CHECK_EQUAL(test::count_above_acceleration(output, cfg.max_acceleration), report.residual_accelerations);
        BOOST_CHECK_LE(report.residual_accelerations, report.damped_accelerations);
        BOOST_CHECK_GE(test::min_time_step(output), cfg.min_time_interval - 1e-9);
    }
}

BOOST_AUTO_TEST_SUITE_END()
