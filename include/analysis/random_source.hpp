#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace onto {

/**
 * @brief Source of uniform draws in [0, 1) for sampling and simulation
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double next_unit() = 0;
};

// Mersenne Twister; reproducible for a given seed
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed), dist_(0.0, 1.0) {}

    double next_unit() override { return dist_(engine_); }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

/**
 * @brief Seeded source if a seed is given, otherwise seeded from std::random_device
 */
std::unique_ptr<RandomSource> make_random_source(std::optional<uint64_t> seed);

/**
 * @brief Pick an index with probability proportional to its weight
 *
 * Non-positive weights are never chosen. Returns nullopt if no weight is
 * positive.
 */
std::optional<size_t> weighted_choice(const std::vector<double>& weights, RandomSource& random);

} // namespace onto
