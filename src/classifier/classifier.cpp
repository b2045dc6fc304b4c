#include "classifier/classifier.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

#ifdef ONTOSCOPE_WITH_ONNXRUNTIME
#include "classifier/onnx_classifier.hpp"
#endif

using json = nlohmann::json;

namespace onto {

namespace {

void apply_activation(const std::string& activation, std::vector<double>& values) {
    if (activation == "linear") {
        return;
    }
    if (activation == "relu") {
        for (double& v : values) v = std::max(0.0, v);
    } else if (activation == "sigmoid") {
        for (double& v : values) v = 1.0 / (1.0 + std::exp(-v));
    } else if (activation == "tanh") {
        for (double& v : values) v = std::tanh(v);
    } else if (activation == "softmax") {
        double max_v = *std::max_element(values.begin(), values.end());
        double sum = 0.0;
        for (double& v : values) {
            v = std::exp(v - max_v);
            sum += v;
        }
        for (double& v : values) v /= sum;
    }
}

bool known_activation(const std::string& activation) {
    return activation == "linear" || activation == "relu" || activation == "sigmoid" ||
           activation == "tanh" || activation == "softmax";
}

} // namespace

MlpClassifier::MlpClassifier(std::vector<DenseLayer> layers, size_t output_index)
    : layers_(std::move(layers)), output_index_(output_index) {}

MlpClassifier MlpClassifier::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ClassifierUnavailable("cannot open model " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ClassifierUnavailable("cannot parse model " + path + ": " + e.what());
    }
    return from_json(j);
}

MlpClassifier MlpClassifier::from_json(const json& j) {
    std::vector<DenseLayer> layers;
    size_t output_index = 1;

    try {
        for (const auto& lj : j.at("layers")) {
            DenseLayer layer;
            layer.weights = lj.at("weights").get<std::vector<std::vector<double>>>();
            layer.bias = lj.at("bias").get<std::vector<double>>();
            layer.activation = lj.value("activation", "linear");
            layers.push_back(std::move(layer));
        }
        output_index = j.value("output_index", static_cast<size_t>(1));
    } catch (const json::exception& e) {
        throw ClassifierUnavailable(std::string("malformed model: ") + e.what());
    }

    if (layers.empty()) {
        throw ClassifierUnavailable("model has no layers");
    }

    size_t width = std::tuple_size<FeatureVector>::value;
    for (size_t i = 0; i < layers.size(); ++i) {
        const DenseLayer& layer = layers[i];
        if (layer.output_width() == 0 || layer.bias.size() != layer.output_width()) {
            throw ClassifierUnavailable("layer " + std::to_string(i) + " has inconsistent bias");
        }
        for (const auto& row : layer.weights) {
            if (row.size() != width) {
                throw ClassifierUnavailable("layer " + std::to_string(i) + " expects " +
                                            std::to_string(row.size()) + " inputs, got " +
                                            std::to_string(width));
            }
        }
        if (!known_activation(layer.activation)) {
            throw ClassifierUnavailable("unknown activation '" + layer.activation + "'");
        }
        width = layer.output_width();
    }

    if (output_index >= width) {
        throw ClassifierUnavailable("output_index " + std::to_string(output_index) +
                                    " out of range for " + std::to_string(width) + " outputs");
    }

    return MlpClassifier(std::move(layers), output_index);
}

double MlpClassifier::score(const FeatureVector& features) const {
    std::vector<double> values(features.begin(), features.end());

    for (const auto& layer : layers_) {
        std::vector<double> next(layer.output_width(), 0.0);
        for (size_t o = 0; o < layer.output_width(); ++o) {
            double sum = layer.bias[o];
            for (size_t i = 0; i < values.size(); ++i) {
                sum += layer.weights[o][i] * values[i];
            }
            next[o] = sum;
        }
        apply_activation(layer.activation, next);
        values = std::move(next);
    }

    return std::clamp(values[output_index_], 0.0, 1.0);
}

std::unique_ptr<Classifier> load_classifier(const std::string& path) {
    if (std::filesystem::path(path).extension() == ".onnx") {
#ifdef ONTOSCOPE_WITH_ONNXRUNTIME
        return std::make_unique<OnnxClassifier>(path);
#else
        throw ClassifierUnavailable("cannot load " + path + ": built without ONNX Runtime");
#endif
    }
    return std::make_unique<MlpClassifier>(MlpClassifier::load_from_json(path));
}

} // namespace onto
