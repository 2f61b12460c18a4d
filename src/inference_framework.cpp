#include "inference_framework.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sound_hazard {

std::string to_string(InferenceFramework framework) {
    switch (framework) {
        case InferenceFramework::TfliteCpu: return "tflite_cpu";
        case InferenceFramework::TfliteGpu: return "tflite_gpu";
        case InferenceFramework::TfliteNnapi: return "tflite_nnapi";
        case InferenceFramework::TfliteMetal: return "tflite_metal";
        case InferenceFramework::OnnxRuntime: return "onnx_runtime";
        case InferenceFramework::CoreMl: return "coreml";
        case InferenceFramework::PytorchMobile: return "pytorch_mobile";
    }
    throw std::invalid_argument("Unknown inference framework value");
}

std::string display_name(InferenceFramework framework) {
    switch (framework) {
        case InferenceFramework::TfliteCpu: return "TensorFlow Lite";
        case InferenceFramework::TfliteGpu: return "TensorFlow Lite (GPU Delegate)";
        case InferenceFramework::TfliteNnapi: return "TensorFlow Lite (NNAPI Delegate)";
        case InferenceFramework::TfliteMetal: return "TensorFlow Lite (Metal Delegate)";
        case InferenceFramework::OnnxRuntime: return "ONNX Runtime";
        case InferenceFramework::CoreMl: return "Core ML";
        case InferenceFramework::PytorchMobile: return "PyTorch Mobile";
    }
    throw std::invalid_argument("Unknown inference framework value");
}

InferenceFramework framework_from_string(const std::string& tag) {
    std::string lowered = tag;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto framework : kAllFrameworks) {
        if (to_string(framework) == lowered) {
            return framework;
        }
    }
    throw std::invalid_argument("Unknown inference framework: " + tag);
}

} // namespace sound_hazard
