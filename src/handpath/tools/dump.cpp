#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <handpath/synth/synth.hpp>

namespace {

using namespace handpath;

constexpr std::string_view k_usage =
    "usage: handpath-dump x0 y0 x1 y1 [--duration seconds] [--seed n] [--config file.json] [--events]";

struct arguments {
    types::point2d start;
    types::point2d end;
    std::optional<double> duration;
    std::optional<std::uint64_t> seed;
    std::optional<std::string> config_path;
    bool events = false;
};

double parse_double(const std::string& text, std::string_view what) {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters in " + std::string{what} + ": '" + text + "'");
    }
    return value;
}

arguments parse_arguments(int argc, char* argv[]) {
    if (argc < 5) {
        throw std::invalid_argument(std::string{k_usage});
    }

    arguments args{
        .start = {parse_double(argv[1], "x0"), parse_double(argv[2], "y0")},
        .end = {parse_double(argv[3], "x1"), parse_double(argv[4], "y1")},
    };

    for (int i = 5; i < argc; ++i) {
        const std::string_view flag{argv[i]};
        if (flag == "--events") {
            args.events = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + std::string{flag});
        }
        const std::string value{argv[++i]};
        if (flag == "--duration") {
            args.duration = parse_double(value, "--duration");
        } else if (flag == "--seed") {
            args.seed = std::stoull(value);
        } else if (flag == "--config") {
            args.config_path = value;
        } else {
            throw std::invalid_argument("unknown option " + std::string{flag} + "\n" + std::string{k_usage});
        }
    }

    return args;
}

synth::generator_config load_config(const std::string& path) {
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error("cannot open config file " + path);
    }
    const std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return synth::config_from_json(text);
}

int run(int argc, char* argv[]) try {
    const auto args = parse_arguments(argc, argv);

    synth::generation_event_collector collector;
    const synth::trajectory_generator generator{{
        .config = args.config_path ? load_config(*args.config_path) : synth::generator_config{},
        .observer = &collector,
    }};

    auto rng = args.seed ? synth::random_source{*args.seed} : synth::random_source{};
    const auto traj = generator.generate(args.start, args.end, args.duration, rng);

    if (args.events) {
        std::cout << synth::serialize_trajectory_to_json(traj, collector) << std::endl;
    } else {
        synth::write_trajectory_json(std::cout, traj);
        std::cout << std::endl;
    }

    return EXIT_SUCCESS;
} catch (const std::exception& ex) {
    std::cerr << "ERROR: " << ex.what() << std::endl;
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    return run(argc, argv);
}
