#include <handpath/synth/random_source.hpp>

#include <numeric>
#include <stdexcept>

namespace handpath::synth {

random_source::random_source() : engine_{std::random_device{}()} {}

random_source::random_source(std::uint64_t seed) : engine_{seed} {}

double random_source::uniform(double lo, double hi) {
    if (lo == hi) {
        return lo;
    }
    return std::uniform_real_distribution<double>{lo, hi}(engine_);
}

double random_source::uniform(const types::value_range& range) {
    return uniform(range.lower, range.upper);
}

double random_source::gaussian(double mean, double stddev) {
    if (stddev <= 0.0) {
        return mean;
    }
    return std::normal_distribution<double>{mean, stddev}(engine_);
}

bool random_source::chance(types::probability p) {
    return uniform(0.0, 1.0) < p.value;
}

std::size_t random_source::weighted_index(std::span<const double> weights) {
    if (weights.empty()) {
        throw std::invalid_argument{"weighted_index requires at least one weight"};
    }
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        throw std::invalid_argument{"weighted_index requires a positive total weight"};
    }

    const double pick = uniform(0.0, total);
    double cumulative = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        cumulative += weights[i];
        if (pick < cumulative) {
            return i;
        }
    }

    // Rounding can leave pick a hair above the final cumulative sum.
    return weights.size() - 1;
}

}  // namespace handpath::synth
