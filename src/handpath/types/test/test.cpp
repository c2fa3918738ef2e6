#define BOOST_TEST_MODULE handpath_types_test

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <handpath/types/point.hpp>
#include <handpath/types/probability.hpp>
#include <handpath/types/trajectory.hpp>
#include <handpath/types/value_range.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

using namespace handpath::types;

BOOST_AUTO_TEST_SUITE(point_tests)

BOOST_AUTO_TEST_CASE(derivatives_default_to_zero) {
    const point p{.x = 1.0, .y = 2.0, .timestamp = 3.0};
    BOOST_CHECK_EQUAL(p.velocity_x, 0.0);
    BOOST_CHECK_EQUAL(p.velocity_y, 0.0);
    BOOST_CHECK_EQUAL(p.acceleration_x, 0.0);
    BOOST_CHECK_EQUAL(p.acceleration_y, 0.0);
}

BOOST_AUTO_TEST_CASE(magnitudes) {
    const point p{.x = 0.0, .y = 0.0, .timestamp = 0.0, .velocity_x = 3.0, .velocity_y = 4.0, .acceleration_x = -6.0, .acceleration_y = 8.0};
    BOOST_CHECK_CLOSE(speed(p), 5.0, 1e-9);
    BOOST_CHECK_CLOSE(acceleration_magnitude(p), 10.0, 1e-9);
    BOOST_CHECK_CLOSE(distance(point2d{1.0, 1.0}, point2d{4.0, 5.0}), 5.0, 1e-9);

    const auto pos = position(point{.x = 7.0, .y = -2.0, .timestamp = 1.0});
    BOOST_CHECK_EQUAL(pos.x, 7.0);
    BOOST_CHECK_EQUAL(pos.y, -2.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(probability_tests)

BOOST_AUTO_TEST_CASE(accepts_unit_interval) {
    BOOST_CHECK_EQUAL(probability{0.0}.value, 0.0);
    BOOST_CHECK_EQUAL(probability{0.25}.value, 0.25);
    BOOST_CHECK_EQUAL(probability{1.0}.value, 1.0);
}

BOOST_AUTO_TEST_CASE(rejects_out_of_range) {
    BOOST_CHECK_THROW(probability{-0.01}, std::invalid_argument);
    BOOST_CHECK_THROW(probability{1.01}, std::invalid_argument);
    BOOST_CHECK_THROW(probability{std::nan("")}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(value_range_tests)

BOOST_AUTO_TEST_CASE(range_queries) {
    constexpr value_range r{0.2, 3.0};
    static_assert(r.ordered());
    static_assert(r.contains(0.2));
    static_assert(r.contains(3.0));
    static_assert(!r.contains(3.5));

    BOOST_CHECK_EQUAL(r.clamp(0.1), 0.2);
    BOOST_CHECK_EQUAL(r.clamp(1.5), 1.5);
    BOOST_CHECK_EQUAL(r.clamp(9.0), 3.0);

    BOOST_CHECK(!(value_range{2.0, 1.0}.ordered()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(trajectory_tests)

BOOST_AUTO_TEST_CASE(empty_trajectory_throws) {
    BOOST_CHECK_THROW(trajectory{std::vector<point>{}}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(summary_statistics) {
    // Three points along an L: (0,0) -> (3,0) -> (3,4) over two seconds.
    const trajectory traj{{
        {.x = 0.0, .y = 0.0, .timestamp = 10.0},
        {.x = 3.0, .y = 0.0, .timestamp = 11.0, .acceleration_x = 3.0, .acceleration_y = 4.0},
        {.x = 3.0, .y = 4.0, .timestamp = 12.0, .acceleration_x = 1.0},
    }};

    BOOST_CHECK_EQUAL(traj.size(), 3U);
    BOOST_CHECK(!traj.empty());
    BOOST_CHECK_CLOSE(traj.elapsed().count(), 2.0, 1e-9);
    BOOST_CHECK_CLOSE(traj.displacement(), 5.0, 1e-9);
    BOOST_CHECK_CLOSE(traj.path_length(), 7.0, 1e-9);
    BOOST_CHECK_CLOSE(traj.average_speed(), 2.5, 1e-9);
    BOOST_CHECK_CLOSE(traj.peak_acceleration(), 5.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(single_point_has_zero_average_speed) {
    const trajectory traj{std::vector<point>{{.x = 1.0, .y = 1.0, .timestamp = 0.5}}};
    BOOST_CHECK_EQUAL(traj.elapsed().count(), 0.0);
    BOOST_CHECK_EQUAL(traj.average_speed(), 0.0);
    BOOST_CHECK_EQUAL(traj.path_length(), 0.0);
}

BOOST_AUTO_TEST_CASE(element_access) {
    const trajectory traj{{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 1.0, .y = 2.0, .timestamp = 0.1},
    }};

    BOOST_CHECK_EQUAL(traj[1].y, 2.0);
    BOOST_CHECK_EQUAL(traj.at(0).x, 0.0);
    BOOST_CHECK_THROW(static_cast<void>(traj.at(2)), std::out_of_range);
    BOOST_CHECK_EQUAL(traj.front().timestamp, 0.0);
    BOOST_CHECK_EQUAL(traj.back().timestamp, 0.1);

    std::size_t count = 0;
    for (const auto& p : traj) {
        BOOST_CHECK(p.timestamp >= 0.0);
        ++count;
    }
    BOOST_CHECK_EQUAL(count, traj.size());
}

BOOST_AUTO_TEST_CASE(release_transfers_points) {
    trajectory traj{{
        {.x = 0.0, .y = 0.0, .timestamp = 0.0},
        {.x = 1.0, .y = 1.0, .timestamp = 0.1},
    }};
    const auto points = std::move(traj).release();
    BOOST_CHECK_EQUAL(points.size(), 2U);
    BOOST_CHECK_EQUAL(points.back().x, 1.0);
}

BOOST_AUTO_TEST_SUITE_END()
