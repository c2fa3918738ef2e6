#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

#include <handpath/types/probability.hpp>
#include <handpath/types/value_range.hpp>

namespace handpath::synth {

///
/// Pseudo-random source threaded explicitly through every pipeline stage.
///
/// Every probabilistic decision of the generator draws from the instance passed to
/// it, so two runs from equal seeds make identical decisions in identical order.
/// Not thread-safe; give each concurrent caller its own instance.
///
class random_source {
   public:
    using engine_type = std::mt19937_64;

    ///
    /// Constructs a source seeded from std::random_device.
    ///
    random_source();

    ///
    /// Constructs a deterministic source.
    ///
    /// @param seed Engine seed
    ///
    explicit random_source(std::uint64_t seed);

    ///
    /// Draws uniformly from [lo, hi).
    ///
    /// A degenerate interval (lo == hi) returns lo.
    ///
    double uniform(double lo, double hi);

    ///
    /// Draws uniformly from a configured range.
    ///
    double uniform(const types::value_range& range);

    ///
    /// Draws from a normal distribution.
    ///
    /// @param mean Mean of the distribution
    /// @param stddev Standard deviation; zero returns mean exactly
    ///
    double gaussian(double mean, double stddev);

    ///
    /// Bernoulli trial: true with probability p.
    ///
    bool chance(types::probability p);

    ///
    /// Picks an index with probability proportional to its weight.
    ///
    /// @param weights Non-negative weights, at least one positive
    /// @return Index into weights
    /// @throws std::invalid_argument if weights is empty or sums to zero
    ///
    std::size_t weighted_index(std::span<const double> weights);

   private:
    engine_type engine_;
};

}  // namespace handpath::synth
