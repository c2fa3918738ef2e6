#include <handpath/synth/tensor_export.hpp>

namespace handpath::synth {

xt::xarray<double> to_xarray(const types::trajectory& traj) {
    using columns = trajectory_columns;

    const xt::xarray<double>::shape_type shape = {traj.size(), columns::k_count};
    xt::xarray<double> table(shape);

    std::size_t row = 0;
    for (const auto& p : traj) {
        table(row, columns::k_x) = p.x;
        table(row, columns::k_y) = p.y;
        table(row, columns::k_timestamp) = p.timestamp;
        table(row, columns::k_velocity_x) = p.velocity_x;
        table(row, columns::k_velocity_y) = p.velocity_y;
        table(row, columns::k_acceleration_x) = p.acceleration_x;
        table(row, columns::k_acceleration_y) = p.acceleration_y;
        ++row;
    }

    return table;
}

}  // namespace handpath::synth
