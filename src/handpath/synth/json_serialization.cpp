#include <handpath/synth/json_serialization.hpp>

#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

#include <json/json.h>

namespace handpath::synth {

namespace {

// Overload set for std::visit over generation events
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

Json::Value range_to_json(const types::value_range& range) {
    Json::Value result(Json::arrayValue);
    result.append(range.lower);
    result.append(range.upper);
    return result;
}

Json::Value serialize_metadata(const types::trajectory& traj) {
    Json::Value metadata(Json::objectValue);
    metadata["num_points"] = static_cast<Json::UInt64>(traj.size());
    metadata["start_timestamp"] = traj.front().timestamp;
    metadata["elapsed"] = traj.elapsed().count();
    metadata["displacement"] = traj.displacement();
    metadata["path_length"] = traj.path_length();
    metadata["average_speed"] = traj.average_speed();
    metadata["peak_acceleration"] = traj.peak_acceleration();
    return metadata;
}

// Serialize points as a struct of arrays
Json::Value serialize_points(const types::trajectory& traj) {
    Json::Value times(Json::arrayValue);
    Json::Value xs(Json::arrayValue);
    Json::Value ys(Json::arrayValue);
    Json::Value vxs(Json::arrayValue);
    Json::Value vys(Json::arrayValue);
    Json::Value axs(Json::arrayValue);
    Json::Value ays(Json::arrayValue);

    const auto n = static_cast<Json::ArrayIndex>(traj.size());
    for (auto* column : {&times, &xs, &ys, &vxs, &vys, &axs, &ays}) {
        column->resize(n);
    }

    const double t0 = traj.front().timestamp;
    for (Json::ArrayIndex i = 0; i < n; ++i) {
        const auto& p = traj[i];
        times[i] = p.timestamp - t0;
        xs[i] = p.x;
        ys[i] = p.y;
        vxs[i] = p.velocity_x;
        vys[i] = p.velocity_y;
        axs[i] = p.acceleration_x;
        ays[i] = p.acceleration_y;
    }

    Json::Value result(Json::objectValue);
    result["time"] = std::move(times);
    result["x"] = std::move(xs);
    result["y"] = std::move(ys);
    result["velocity_x"] = std::move(vxs);
    result["velocity_y"] = std::move(vys);
    result["acceleration_x"] = std::move(axs);
    result["acceleration_y"] = std::move(ays);
    return result;
}

Json::Value serialize_events(const generation_event_collector& collector) {
    Json::Value result(Json::objectValue);
    result["short_trajectory"] = Json::Value::null;
    result["plan"] = Json::Value::null;
    result["characteristics"] = Json::Value::null;
    result["validation"] = Json::Value::null;

    Json::Value counts(Json::objectValue);

    for (const auto& ev : collector) {
        std::visit(overloaded{
                       [&](const generation_observer::short_trajectory_event& e) {
                           Json::Value v(Json::objectValue);
                           v["distance"] = e.distance;
                           result["short_trajectory"] = std::move(v);
                       },
                       [&](const generation_observer::planned_event& e) {
                           Json::Value v(Json::objectValue);
                           v["distance"] = e.plan.distance;
                           v["duration"] = e.plan.duration;
                           v["style"] = std::string{to_string(e.plan.style)};
                           v["derived_duration"] = e.plan.derived_duration;
                           result["plan"] = std::move(v);
                       },
                       [&](const generation_observer::skeleton_event& e) {
                           counts["skeleton"] = static_cast<Json::UInt64>(e.point_count);
                       },
                       [&](const generation_observer::characteristics_event& e) {
                           Json::Value v(Json::objectValue);
                           v["micro_corrections"] = static_cast<Json::UInt64>(e.report.micro_corrections);
                           v["pauses"] = static_cast<Json::UInt64>(e.report.pauses);
                           v["direction_changes"] = static_cast<Json::UInt64>(e.report.direction_changes);
                           v["overshoot"] = e.report.overshoot;
                           result["characteristics"] = std::move(v);
                           counts["characteristics"] = static_cast<Json::UInt64>(e.point_count);
                       },
                       [&](const generation_observer::smoothing_event& e) {
                           counts["smoothing"] = static_cast<Json::UInt64>(e.point_count);
                       },
                       [&](const generation_observer::validation_event& e) {
                           Json::Value v(Json::objectValue);
                           v["clamped_timestamps"] = static_cast<Json::UInt64>(e.report.clamped_timestamps);
                           v["damped_accelerations"] = static_cast<Json::UInt64>(e.report.damped_accelerations);
                           v["residual_accelerations"] = static_cast<Json::UInt64>(e.report.residual_accelerations);
                           v["repaired_gaps"] = static_cast<Json::UInt64>(e.report.repaired_gaps);
                           v["unrepaired_gaps"] = static_cast<Json::UInt64>(e.report.unrepaired_gaps);
                           v["synthesized_points"] = static_cast<Json::UInt64>(e.report.synthesized_points);
                           result["validation"] = std::move(v);
                           counts["validation"] = static_cast<Json::UInt64>(e.point_count);
                       },
                   },
                   ev);
    }

    result["stage_point_counts"] = std::move(counts);
    return result;
}

std::string write_compact(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

double read_number(const Json::Value& value, const std::string& key) {
    if (!value.isNumeric()) {
        throw std::invalid_argument("config key '" + key + "' must be a number");
    }
    return value.asDouble();
}

types::value_range read_range(const Json::Value& value, const std::string& key) {
    if (!value.isArray() || value.size() != 2 || !value[0].isNumeric() || !value[1].isNumeric()) {
        throw std::invalid_argument("config key '" + key + "' must be a two-element numeric array");
    }
    return {value[0].asDouble(), value[1].asDouble()};
}

}  // namespace

std::string serialize_trajectory_to_json(const types::trajectory& traj) {
    Json::Value root(Json::objectValue);
    root["metadata"] = serialize_metadata(traj);
    root["points"] = serialize_points(traj);
    return write_compact(root);
}

std::string serialize_trajectory_to_json(const types::trajectory& traj, const generation_event_collector& collector) {
    Json::Value root(Json::objectValue);
    root["metadata"] = serialize_metadata(traj);
    root["points"] = serialize_points(traj);
    root["events"] = serialize_events(collector);
    return write_compact(root);
}

void write_trajectory_json(std::ostream& out, const types::trajectory& traj) {
    out << serialize_trajectory_to_json(traj);
}

std::string config_to_json(const generator_config& cfg) {
    Json::Value root(Json::objectValue);
    root["base_noise_amplitude"] = cfg.base_noise_amplitude;
    root["direction_change_probability"] = cfg.direction_change_probability.value;
    root["micro_correction_probability"] = cfg.micro_correction_probability.value;
    root["pause_probability"] = cfg.pause_probability.value;
    root["overshoot_probability"] = cfg.overshoot_probability.value;
    root["speed_variation_range"] = range_to_json(cfg.speed_variation_range);
    root["avg_speed_range"] = range_to_json(cfg.avg_speed_range);
    root["max_acceleration"] = cfg.max_acceleration;
    root["min_time_interval"] = cfg.min_time_interval;
    root["max_time_interval"] = cfg.max_time_interval;
    root["bezier_control_range"] = cfg.bezier_control_range;
    root["max_gap_multiple"] = cfg.max_gap_multiple;
    root["max_trajectory_points"] = static_cast<Json::UInt64>(cfg.max_trajectory_points);
    return write_compact(root);
}

generator_config config_from_json(std::string_view json) {
    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw std::invalid_argument("config is not valid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    generator_config cfg;
    for (const auto& key : root.getMemberNames()) {
        const auto& value = root[key];
        if (key == "base_noise_amplitude") {
            cfg.base_noise_amplitude = read_number(value, key);
        } else if (key == "direction_change_probability") {
            cfg.direction_change_probability = types::probability{read_number(value, key)};
        } else if (key == "micro_correction_probability") {
            cfg.micro_correction_probability = types::probability{read_number(value, key)};
        } else if (key == "pause_probability") {
            cfg.pause_probability = types::probability{read_number(value, key)};
        } else if (key == "overshoot_probability") {
            cfg.overshoot_probability = types::probability{read_number(value, key)};
        } else if (key == "speed_variation_range") {
            cfg.speed_variation_range = read_range(value, key);
        } else if (key == "avg_speed_range") {
            cfg.avg_speed_range = read_range(value, key);
        } else if (key == "max_acceleration") {
            cfg.max_acceleration = read_number(value, key);
        } else if (key == "min_time_interval") {
            cfg.min_time_interval = read_number(value, key);
        } else if (key == "max_time_interval") {
            cfg.max_time_interval = read_number(value, key);
        } else if (key == "bezier_control_range") {
            cfg.bezier_control_range = read_number(value, key);
        } else if (key == "max_gap_multiple") {
            cfg.max_gap_multiple = read_number(value, key);
        } else if (key == "max_trajectory_points") {
            if (!value.isUInt64()) {
                throw std::invalid_argument("config key 'max_trajectory_points' must be a non-negative integer");
            }
            cfg.max_trajectory_points = static_cast<std::size_t>(value.asUInt64());
        } else {
            throw std::invalid_argument("unknown config key '" + key + "'");
        }
    }

    cfg.validate();
    return cfg;
}

}  // namespace handpath::synth
