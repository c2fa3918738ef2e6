#include <handpath/service/handpath_mlmodel_service.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>
#include <boost/variant/get.hpp>

#include <viam/sdk/log/logging.hpp>

#include <handpath/synth/generator.hpp>
#include <handpath/synth/random_source.hpp>

namespace handpath::service {

namespace {

namespace vsdk = ::viam::sdk;

// Flat output buffers, row-major, referenced by the returned tensor views.
struct service_result {
    std::vector<double> timestamps;
    std::vector<double> positions;
    std::vector<double> velocities;
    std::vector<double> accelerations;
};

// Holds owned output data and the named_tensor_views that reference it.
// Returned via an aliasing shared_ptr so the views remain valid for the caller.
struct infer_result {
    service_result data;
    handpath_mlmodel_service::named_tensor_views views;
};

constexpr std::size_t k_dimensions = 2;

const auto& get_double_tensor(const handpath_mlmodel_service::named_tensor_views& inputs, const std::string& name) {
    const auto it = inputs.find(name);
    if (it == inputs.end()) {
        throw std::invalid_argument("missing required input tensor: " + name);
    }
    const auto* view = boost::get<handpath_mlmodel_service::tensor_view<double>>(&it->second);
    if (!view) {
        throw std::invalid_argument("input tensor '" + name + "' has wrong type (expected float64)");
    }
    return *view;
}

// Reads a shape-[2] float64 tensor as a position.
types::point2d get_position(const handpath_mlmodel_service::named_tensor_views& inputs, const std::string& name) {
    const auto& view = get_double_tensor(inputs, name);
    if (view.size() != k_dimensions) {
        throw std::invalid_argument("input tensor '" + name + "' must have shape [2]");
    }
    return {view.flat(0), view.flat(1)};
}

// Absent or zero duration means derive one from distance.
std::optional<double> get_duration(const handpath_mlmodel_service::named_tensor_views& inputs) {
    if (inputs.find("duration_sec") == inputs.end()) {
        return std::nullopt;
    }
    const auto& view = get_double_tensor(inputs, "duration_sec");
    if (view.size() != 1) {
        throw std::invalid_argument("input tensor 'duration_sec' must be a scalar (shape [1])");
    }
    const double duration = view.flat(0);
    if (duration == 0.0) {
        return std::nullopt;
    }
    return duration;
}

synth::random_source make_random_source(const handpath_mlmodel_service::named_tensor_views& inputs) {
    const auto it = inputs.find("seed");
    if (it == inputs.end()) {
        return synth::random_source{};
    }
    const auto* view = boost::get<handpath_mlmodel_service::tensor_view<std::int64_t>>(&it->second);
    if (!view) {
        throw std::invalid_argument("input tensor 'seed' has wrong type (expected int64)");
    }
    if (view->size() != 1) {
        throw std::invalid_argument("input tensor 'seed' must be a scalar (shape [1])");
    }
    return synth::random_source{static_cast<std::uint64_t>(view->flat(0))};
}

double attribute_number(const vsdk::ProtoValue& value, const std::string& key) {
    const auto* number = value.get<double>();
    if (!number) {
        throw std::invalid_argument("attribute '" + key + "' must be a number");
    }
    return *number;
}

types::value_range attribute_range(const vsdk::ProtoValue& value, const std::string& key) {
    const auto* list = value.get<std::vector<vsdk::ProtoValue>>();
    if (!list || list->size() != 2) {
        throw std::invalid_argument("attribute '" + key + "' must be a list of two numbers");
    }
    return {attribute_number((*list)[0], key), attribute_number((*list)[1], key)};
}

std::size_t attribute_count(const vsdk::ProtoValue& value, const std::string& key) {
    const double number = attribute_number(value, key);
    if (!std::isfinite(number) || number < 0.0 || std::floor(number) != number) {
        throw std::invalid_argument("attribute '" + key + "' must be a non-negative integer");
    }
    return boost::numeric_cast<std::size_t>(number);
}

}  // namespace

handpath_mlmodel_service::handpath_mlmodel_service(vsdk::Dependencies deps, vsdk::ResourceConfig config)
    : MLModelService(config.name()) {
    reconfigure(deps, config);
}

synth::generator_config handpath_mlmodel_service::parse_config(const vsdk::ResourceConfig& cfg) {
    synth::generator_config result;

    for (const auto& [key, value] : cfg.attributes()) {
        if (key == "base_noise_amplitude") {
            result.base_noise_amplitude = attribute_number(value, key);
        } else if (key == "direction_change_probability") {
            result.direction_change_probability = types::probability{attribute_number(value, key)};
        } else if (key == "micro_correction_probability") {
            result.micro_correction_probability = types::probability{attribute_number(value, key)};
        } else if (key == "pause_probability") {
            result.pause_probability = types::probability{attribute_number(value, key)};
        } else if (key == "overshoot_probability") {
            result.overshoot_probability = types::probability{attribute_number(value, key)};
        } else if (key == "speed_variation_range") {
            result.speed_variation_range = attribute_range(value, key);
        } else if (key == "avg_speed_range") {
            result.avg_speed_range = attribute_range(value, key);
        } else if (key == "max_acceleration") {
            result.max_acceleration = attribute_number(value, key);
        } else if (key == "min_time_interval") {
            result.min_time_interval = attribute_number(value, key);
        } else if (key == "max_time_interval") {
            result.max_time_interval = attribute_number(value, key);
        } else if (key == "bezier_control_range") {
            result.bezier_control_range = attribute_number(value, key);
        } else if (key == "max_gap_multiple") {
            result.max_gap_multiple = attribute_number(value, key);
        } else if (key == "max_trajectory_points") {
            result.max_trajectory_points = attribute_count(value, key);
        } else {
            throw std::invalid_argument("unknown attribute '" + key + "'");
        }
    }

    result.validate();
    return result;
}

std::vector<std::string> handpath_mlmodel_service::validate(const vsdk::ResourceConfig& cfg) {
    parse_config(cfg);
    return {};
}

void handpath_mlmodel_service::reconfigure(const vsdk::Dependencies&, const vsdk::ResourceConfig& cfg) {
    auto new_config = parse_config(cfg);

    VIAM_SDK_LOG(info) << "handpath service " << cfg.name() << " configured (max_acceleration " << new_config.max_acceleration
                       << ", max_trajectory_points " << new_config.max_trajectory_points << ")";

    const std::unique_lock lock{config_mutex_};
    config_ = std::move(new_config);
}

std::shared_ptr<handpath_mlmodel_service::named_tensor_views> handpath_mlmodel_service::infer(const named_tensor_views& inputs,
                                                                                              const vsdk::ProtoStruct&) {
    // Snapshot config under the read lock, then release
    synth::generator_config local_config;
    {
        const std::shared_lock lock{config_mutex_};
        local_config = config_;
    }

    const auto start = get_position(inputs, "start_px");
    const auto end = get_position(inputs, "end_px");
    const auto duration = get_duration(inputs);
    auto rng = make_random_source(inputs);

    const synth::trajectory_generator generator{{.config = local_config}};
    const auto traj = generator.generate(start, end, duration, rng);

    VIAM_SDK_LOG(debug) << "generated " << traj.size() << " points over " << traj.elapsed().count() << " s from (" << start.x << ", "
                        << start.y << ") to (" << end.x << ", " << end.y << ")";

    // Pack output using aliasing shared_ptr for zero-copy output
    auto result_holder = std::make_shared<infer_result>();
    auto& data = result_holder->data;

    const auto n_points = traj.size();
    data.timestamps.reserve(n_points);
    data.positions.reserve(n_points * k_dimensions);
    data.velocities.reserve(n_points * k_dimensions);
    data.accelerations.reserve(n_points * k_dimensions);

    const double t0 = traj.front().timestamp;
    for (const auto& p : traj) {
        data.timestamps.push_back(p.timestamp - t0);
        data.positions.insert(data.positions.end(), {p.x, p.y});
        data.velocities.insert(data.velocities.end(), {p.velocity_x, p.velocity_y});
        data.accelerations.insert(data.accelerations.end(), {p.acceleration_x, p.acceleration_y});
    }

    result_holder->views.emplace("timestamps_sec", make_tensor_view(data.timestamps.data(), n_points, {n_points}));
    result_holder->views.emplace("positions_px",
                                 make_tensor_view(data.positions.data(), n_points * k_dimensions, {n_points, k_dimensions}));
    result_holder->views.emplace("velocities_px_per_sec",
                                 make_tensor_view(data.velocities.data(), n_points * k_dimensions, {n_points, k_dimensions}));
    result_holder->views.emplace("accelerations_px_per_sec2",
                                 make_tensor_view(data.accelerations.data(), n_points * k_dimensions, {n_points, k_dimensions}));

    auto* views = &result_holder->views;
    return {std::move(result_holder), views};
}

struct handpath_mlmodel_service::metadata handpath_mlmodel_service::metadata(const vsdk::ProtoStruct&) {
    return {
        .name = "handpath",
        .type = "other",
        .description = "Human-like pointer trajectory synthesis",
        .inputs =
            {
                {.name = "start_px",
                 .description = "Start position (in pixels) [2]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {2},
                 .associated_files = {},
                 .extra = {}},
                {.name = "end_px",
                 .description = "End position (in pixels) [2]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {2},
                 .associated_files = {},
                 .extra = {}},
                {.name = "duration_sec",
                 .description = "Optional target duration (in seconds), 0 derives one from distance [scalar]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {1},
                 .associated_files = {},
                 .extra = {}},
                {.name = "seed",
                 .description = "Optional random seed for reproducible output [scalar]",
                 .data_type = tensor_info::data_types::k_int64,
                 .shape = {1},
                 .associated_files = {},
                 .extra = {}},
            },
        .outputs =
            {
                {.name = "timestamps_sec",
                 .description = "Time of each point relative to the first (in seconds) [n_points]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1},
                 .associated_files = {},
                 .extra = {}},
                {.name = "positions_px",
                 .description = "Pointer positions (in pixels) [n_points, 2]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 2},
                 .associated_files = {},
                 .extra = {}},
                {.name = "velocities_px_per_sec",
                 .description = "Pointer velocities (in pixels per second) [n_points, 2]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 2},
                 .associated_files = {},
                 .extra = {}},
                {.name = "accelerations_px_per_sec2",
                 .description = "Pointer accelerations (in pixels per second squared) [n_points, 2]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 2},
                 .associated_files = {},
                 .extra = {}},
            },
    };
}

}  // namespace handpath::service
