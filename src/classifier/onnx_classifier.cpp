#include "classifier/onnx_classifier.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <filesystem>

namespace onto {

struct OnnxClassifier::Impl {
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "ontoscope"};
    Ort::SessionOptions options;
    std::unique_ptr<Ort::Session> session;
    std::string input_name;
    std::string output_name;
};

OnnxClassifier::OnnxClassifier(const std::string& path, size_t output_index)
    : impl_(std::make_unique<Impl>()), output_index_(output_index) {
    if (!std::filesystem::is_regular_file(path)) {
        throw ClassifierUnavailable("cannot open model " + path);
    }

    try {
        impl_->options.SetIntraOpNumThreads(1);
        impl_->session = std::make_unique<Ort::Session>(impl_->env, path.c_str(), impl_->options);

        if (impl_->session->GetInputCount() != 1 || impl_->session->GetOutputCount() == 0) {
            throw ClassifierUnavailable("model " + path + " must have one input and an output");
        }

        Ort::AllocatorWithDefaultOptions allocator;
        impl_->input_name = impl_->session->GetInputNameAllocated(0, allocator).get();
        impl_->output_name = impl_->session->GetOutputNameAllocated(0, allocator).get();

        std::vector<int64_t> shape =
            impl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        // -1 is a symbolic dimension
        if (shape.empty() || (shape.back() != 5 && shape.back() != -1)) {
            throw ClassifierUnavailable("model " + path + " does not take 5 features");
        }
    } catch (const Ort::Exception& e) {
        throw ClassifierUnavailable("cannot load model " + path + ": " + e.what());
    }
}

OnnxClassifier::~OnnxClassifier() = default;

double OnnxClassifier::score(const FeatureVector& features) const {
    std::array<float, 5> input;
    std::transform(features.begin(), features.end(), input.begin(),
                   [](double v) { return static_cast<float>(v); });
    std::array<int64_t, 2> shape{1, 5};

    const char* input_names[] = {impl_->input_name.c_str()};
    const char* output_names[] = {impl_->output_name.c_str()};

    try {
        Ort::MemoryInfo memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value tensor = Ort::Value::CreateTensor<float>(
            memory, input.data(), input.size(), shape.data(), shape.size());

        std::vector<Ort::Value> outputs = impl_->session->Run(
            Ort::RunOptions{nullptr}, input_names, &tensor, 1, output_names, 1);

        size_t count = outputs.front().GetTensorTypeAndShapeInfo().GetElementCount();
        if (output_index_ >= count) {
            throw ClassifierUnavailable("model output has " + std::to_string(count) +
                                        " values, index " + std::to_string(output_index_) +
                                        " requested");
        }
        double confidence = outputs.front().GetTensorData<float>()[output_index_];
        return std::clamp(confidence, 0.0, 1.0);
    } catch (const Ort::Exception& e) {
        throw ClassifierUnavailable(std::string("inference failed: ") + e.what());
    }
}

} // namespace onto
