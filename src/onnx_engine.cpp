#include "onnx_engine.hpp"
#include "audio_features.hpp"
#include "inference_errors.hpp"
#include <onnxruntime_cxx_api.h>
#include <stdexcept>
#include <string>

#ifdef __APPLE__
#include <coreml_provider_factory.h>
#endif

namespace sound_hazard {

class OnnxRuntimeEngine::Impl {
public:
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    std::string input_name;
    std::string output_name;
    size_t input_rank = 2;
};

OnnxRuntimeEngine::OnnxRuntimeEngine(InferenceFramework framework, const InferenceConfig& config,
                                     const PlatformInfo& platform)
    : InferenceEngine(framework, config, platform),
      pimpl_(std::make_unique<Impl>()) {
    if (framework != InferenceFramework::OnnxRuntime && framework != InferenceFramework::CoreMl) {
        throw std::invalid_argument("OnnxRuntimeEngine cannot run " + to_string(framework));
    }
}

OnnxRuntimeEngine::~OnnxRuntimeEngine() {
    dispose();
}

bool OnnxRuntimeEngine::is_coreml_compiled() {
#ifdef __APPLE__
    return true;
#else
    return false;
#endif
}

bool OnnxRuntimeEngine::is_available() const {
    if (framework() == InferenceFramework::CoreMl) {
        return is_coreml_compiled() && platform().supports_coreml;
    }
    return true;
}

std::string OnnxRuntimeEngine::unavailable_reason() const {
    if (!is_coreml_compiled()) {
        return "CoreML execution provider requires an Apple build";
    }
    return "Core ML unsupported on " + to_string(platform().kind);
}

std::string OnnxRuntimeEngine::model_path() const {
    return config().onnx_model_path;
}

void OnnxRuntimeEngine::load(const std::string& model_path) {
    pimpl_->env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "SoundHazard");

    Ort::SessionOptions session_options;
    session_options.SetIntraOpNumThreads(config().num_threads);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

    if (framework() == InferenceFramework::CoreMl) {
#ifdef __APPLE__
        Ort::ThrowOnError(OrtSessionOptionsAppendExecutionProvider_CoreML(session_options, 0));
        log("Using CoreML Execution Provider");
#endif
    }

#ifdef _WIN32
    std::wstring wide_path(model_path.begin(), model_path.end());
    pimpl_->session = std::make_unique<Ort::Session>(*pimpl_->env, wide_path.c_str(), session_options);
#else
    pimpl_->session = std::make_unique<Ort::Session>(*pimpl_->env, model_path.c_str(), session_options);
#endif

    if (pimpl_->session->GetInputCount() == 0 || pimpl_->session->GetOutputCount() == 0) {
        throw EngineInternalError(framework(), "model has no inputs or outputs: " + model_path);
    }

    Ort::AllocatorWithDefaultOptions allocator;
    pimpl_->input_name = pimpl_->session->GetInputNameAllocated(0, allocator).get();
    pimpl_->output_name = pimpl_->session->GetOutputNameAllocated(0, allocator).get();

    auto input_shape = pimpl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    pimpl_->input_rank = input_shape.size();
}

std::vector<float> OnnxRuntimeEngine::run(const float* input, size_t count) {
    std::vector<int64_t> shape;
    if (pimpl_->input_rank <= 1) {
        shape = {static_cast<int64_t>(count)};
    } else {
        shape = {1, static_cast<int64_t>(count)};
    }

    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info, const_cast<float*>(input), count, shape.data(), shape.size());

    const char* input_names[] = {pimpl_->input_name.c_str()};
    const char* output_names[] = {pimpl_->output_name.c_str()};

    auto outputs = pimpl_->session->Run(Ort::RunOptions{nullptr},
                                        input_names, &input_tensor, 1,
                                        output_names, 1);
    if (outputs.empty() || !outputs[0].IsTensor()) {
        throw EngineInternalError(framework(), "model returned no tensor output");
    }

    auto info = outputs[0].GetTensorTypeAndShapeInfo();
    auto output_shape = info.GetShape();
    const size_t total = info.GetElementCount();
    const size_t cols = output_shape.size() >= 2 ? static_cast<size_t>(output_shape.back()) : total;
    const size_t rows = cols > 0 ? total / cols : 0;

    return audio::mean_over_frames(outputs[0].GetTensorData<float>(), rows, cols);
}

void OnnxRuntimeEngine::release() noexcept {
    pimpl_->session.reset();
    pimpl_->env.reset();
    pimpl_->input_name.clear();
    pimpl_->output_name.clear();
}

} // namespace sound_hazard
