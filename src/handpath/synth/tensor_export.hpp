#pragma once

#include <cstddef>

#if __has_include(<xtensor/containers/xarray.hpp>)
#include <xtensor/containers/xarray.hpp>
#else
#include <xtensor/xarray.hpp>
#endif

#include <handpath/types/trajectory.hpp>

namespace handpath::synth {

///
/// Column layout of the table produced by to_xarray().
///
struct trajectory_columns {
    static constexpr std::size_t k_x = 0;
    static constexpr std::size_t k_y = 1;
    static constexpr std::size_t k_timestamp = 2;
    static constexpr std::size_t k_velocity_x = 3;
    static constexpr std::size_t k_velocity_y = 4;
    static constexpr std::size_t k_acceleration_x = 5;
    static constexpr std::size_t k_acceleration_y = 6;
    static constexpr std::size_t k_count = 7;
};

///
/// Copies a trajectory into a dense [n, 7] table, one row per point.
///
/// Timestamps are absolute, as stored in the points. Columns are indexed by
/// trajectory_columns.
///
/// @param traj Trajectory to export
/// @return Table of shape [traj.size(), trajectory_columns::k_count]
///
xt::xarray<double> to_xarray(const types::trajectory& traj);

}  // namespace handpath::synth
