#pragma once

#include "classifier/classifier.hpp"
#include <atomic>
#include <map>
#include <string>

namespace onto {
namespace testing_support {

/**
 * @brief Classifier returning a constant, or a per-frequency override
 *
 * Keyed on frequency since the classifier only sees the feature vector.
 */
class FixedClassifier : public Classifier {
public:
    explicit FixedClassifier(double confidence) : confidence_(confidence) {}

    void set_for_frequency(double frequency, double confidence) {
        by_frequency_[frequency] = confidence;
    }

    double score(const FeatureVector& features) const override {
        ++calls_;
        auto it = by_frequency_.find(features[0]);
        return it != by_frequency_.end() ? it->second : confidence_;
    }

    size_t calls() const { return calls_; }

private:
    double confidence_;
    std::map<double, double> by_frequency_;
    mutable std::atomic<size_t> calls_{0};
};

} // namespace testing_support
} // namespace onto
