#pragma once

#include "classifier/classifier.hpp"
#include <memory>
#include <string>

namespace onto {

/**
 * @brief Keep/drop model run through ONNX Runtime
 *
 * The model takes one float tensor of shape [1, 5] in feature order. The
 * confidence is element output_index of its first output, clamped to [0, 1].
 */
class OnnxClassifier : public Classifier {
public:
    /**
     * @throws ClassifierUnavailable if the file is missing or is not a
     *         model with a 5-wide input
     */
    explicit OnnxClassifier(const std::string& path, size_t output_index = 1);
    ~OnnxClassifier() override;

    OnnxClassifier(const OnnxClassifier&) = delete;
    OnnxClassifier& operator=(const OnnxClassifier&) = delete;

    double score(const FeatureVector& features) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    size_t output_index_;
};

} // namespace onto
