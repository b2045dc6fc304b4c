#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace onto {

// (frequency, uniqueness, entropy, quality, edge_rank)
using FeatureVector = std::array<double, 5>;

/**
 * @brief The keep/drop model could not be loaded or does not fit the features
 */
class ClassifierUnavailable : public std::runtime_error {
public:
    explicit ClassifierUnavailable(const std::string& message)
        : std::runtime_error("Classifier unavailable: " + message) {}
};

/**
 * @brief Pre-trained predicate keep/drop model
 *
 * score() returns the confidence in [0, 1] that a predicate should be kept.
 * Implementations must be deterministic.
 */
class Classifier {
public:
    virtual ~Classifier() = default;
    virtual double score(const FeatureVector& features) const = 0;
};

/**
 * @brief Fully connected layer; weights are [output][input]
 */
struct DenseLayer {
    std::vector<std::vector<double>> weights;
    std::vector<double> bias;
    std::string activation = "linear";      // relu | sigmoid | tanh | linear | softmax

    size_t input_width() const { return weights.empty() ? 0 : weights.front().size(); }
    size_t output_width() const { return weights.size(); }
};

/**
 * @brief Feed-forward network read from a JSON model artifact
 *
 * Artifact layout:
 * {
 *   "layers": [ {"weights": [[...], ...], "bias": [...], "activation": "relu"}, ... ],
 *   "output_index": 1
 * }
 *
 * The confidence is the output neuron at output_index (the "keep" class of
 * a two-class softmax by default), clamped to [0, 1].
 */
class MlpClassifier : public Classifier {
public:
    /**
     * @throws ClassifierUnavailable on a missing file, bad JSON or bad shapes
     */
    static MlpClassifier load_from_json(const std::string& path);
    static MlpClassifier from_json(const nlohmann::json& j);

    double score(const FeatureVector& features) const override;

    const std::vector<DenseLayer>& layers() const { return layers_; }
    size_t output_index() const { return output_index_; }

private:
    MlpClassifier(std::vector<DenseLayer> layers, size_t output_index);

    std::vector<DenseLayer> layers_;
    size_t output_index_ = 1;
};

/**
 * @brief Load the classifier artifact at path
 *
 * ".onnx" files run through ONNX Runtime; anything else is read as a JSON
 * layer artifact.
 *
 * @throws ClassifierUnavailable if the model cannot be loaded, or for an
 *         ONNX model when ONNX Runtime support was not built in
 */
std::unique_ptr<Classifier> load_classifier(const std::string& path);

} // namespace onto
