#include "analysis/random_source.hpp"

namespace onto {

std::unique_ptr<RandomSource> make_random_source(std::optional<uint64_t> seed) {
    if (seed.has_value()) {
        return std::make_unique<SeededRandomSource>(seed.value());
    }
    std::random_device rd;
    uint64_t drawn = (static_cast<uint64_t>(rd()) << 32) | rd();
    return std::make_unique<SeededRandomSource>(drawn);
}

std::optional<size_t> weighted_choice(const std::vector<double>& weights, RandomSource& random) {
    double total = 0.0;
    std::optional<size_t> last_positive;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] > 0.0) {
            total += weights[i];
            last_positive = i;
        }
    }
    if (!last_positive.has_value()) {
        return std::nullopt;
    }

    double r = random.next_unit() * total;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) continue;
        if (r < weights[i]) {
            return i;
        }
        r -= weights[i];
    }
    // Rounding can leave r just above the last bucket
    return last_positive;
}

} // namespace onto
