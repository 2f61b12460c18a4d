#include "tflite_engine.hpp"
#include "audio_features.hpp"
#include "inference_errors.hpp"
#include <algorithm>
#include <stdexcept>

#ifdef SOUND_HAZARD_HAVE_TFLITE
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>

#ifdef SOUND_HAZARD_USE_XNNPACK
#include <tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h>
#endif

#ifdef SOUND_HAZARD_USE_GPU_DELEGATE
#include <tensorflow/lite/delegates/gpu/delegate.h>
#endif

#ifdef __ANDROID__
#include <tensorflow/lite/delegates/nnapi/nnapi_delegate.h>
#endif

#ifdef __APPLE__
#include <tensorflow/lite/delegates/gpu/metal_delegate.h>
#endif
#endif

namespace sound_hazard {

struct TFLiteEngine::Impl {
#ifdef SOUND_HAZARD_HAVE_TFLITE
    // Declaration order matters: the interpreter must go before its delegate
    std::unique_ptr<TfLiteDelegate, void (*)(TfLiteDelegate*)> delegate{nullptr, nullptr};
#ifdef __ANDROID__
    std::unique_ptr<tflite::StatefulNnApiDelegate> nnapi_delegate;
#endif
    std::unique_ptr<tflite::FlatBufferModel> model;
    std::unique_ptr<tflite::Interpreter> interpreter;
#endif
};

TFLiteEngine::TFLiteEngine(InferenceFramework framework, const InferenceConfig& config,
                           const PlatformInfo& platform)
    : InferenceEngine(framework, config, platform),
      impl_(std::make_unique<Impl>()) {
    switch (framework) {
        case InferenceFramework::TfliteCpu:
        case InferenceFramework::TfliteGpu:
        case InferenceFramework::TfliteNnapi:
        case InferenceFramework::TfliteMetal:
            break;
        default:
            throw std::invalid_argument("TFLiteEngine cannot run " + to_string(framework));
    }
}

TFLiteEngine::~TFLiteEngine() {
    dispose();
}

bool TFLiteEngine::is_compiled() {
#ifdef SOUND_HAZARD_HAVE_TFLITE
    return true;
#else
    return false;
#endif
}

bool TFLiteEngine::is_delegate_compiled(InferenceFramework framework) {
    if (!is_compiled()) return false;

    switch (framework) {
        case InferenceFramework::TfliteCpu:
            return true;
        case InferenceFramework::TfliteGpu:
#ifdef SOUND_HAZARD_USE_GPU_DELEGATE
            return true;
#else
            return false;
#endif
        case InferenceFramework::TfliteNnapi:
#ifdef __ANDROID__
            return true;
#else
            return false;
#endif
        case InferenceFramework::TfliteMetal:
#ifdef __APPLE__
            return true;
#else
            return false;
#endif
        default:
            return false;
    }
}

bool TFLiteEngine::is_available() const {
    if (!is_delegate_compiled(framework())) return false;

    switch (framework()) {
        case InferenceFramework::TfliteCpu:
            return true;
        case InferenceFramework::TfliteGpu:
            return platform().supports_gpu_delegate;
        case InferenceFramework::TfliteNnapi:
            return platform().supports_nnapi;
        case InferenceFramework::TfliteMetal:
            return platform().supports_metal;
        default:
            return false;
    }
}

std::string TFLiteEngine::unavailable_reason() const {
    if (!is_compiled()) {
        return "built without TensorFlow Lite";
    }
    if (!is_delegate_compiled(framework())) {
        return "delegate not compiled into this build";
    }
    return "delegate unsupported on " + to_string(platform().kind);
}

std::string TFLiteEngine::model_path() const {
    return config().tflite_model_path;
}

void TFLiteEngine::load(const std::string& model_path) {
#ifndef SOUND_HAZARD_HAVE_TFLITE
    throw UnavailableOnPlatformError(framework(), "built without TensorFlow Lite");
#else
    impl_->model = tflite::FlatBufferModel::BuildFromFile(model_path.c_str());
    if (!impl_->model) {
        throw EngineInternalError(framework(), "failed to load model " + model_path);
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*impl_->model, resolver);
    if (builder(&impl_->interpreter) != kTfLiteOk || !impl_->interpreter) {
        throw EngineInternalError(framework(), "failed to create interpreter");
    }
    impl_->interpreter->SetNumThreads(config().num_threads);

    attach_delegate();

    if (impl_->interpreter->AllocateTensors() != kTfLiteOk) {
        throw EngineInternalError(framework(), "failed to allocate tensors");
    }
#endif
}

void TFLiteEngine::attach_delegate() {
#ifdef SOUND_HAZARD_HAVE_TFLITE
    TfLiteDelegate* target = nullptr;

    switch (framework()) {
        case InferenceFramework::TfliteCpu: {
#ifdef SOUND_HAZARD_USE_XNNPACK
            TfLiteXNNPackDelegateOptions options = TfLiteXNNPackDelegateOptionsDefault();
            options.num_threads = config().num_threads;
            impl_->delegate = {TfLiteXNNPackDelegateCreate(&options), TfLiteXNNPackDelegateDelete};
            target = impl_->delegate.get();
#endif
            break;
        }
        case InferenceFramework::TfliteGpu: {
#ifdef SOUND_HAZARD_USE_GPU_DELEGATE
            TfLiteGpuDelegateOptionsV2 options = TfLiteGpuDelegateOptionsV2Default();
            impl_->delegate = {TfLiteGpuDelegateV2Create(&options), TfLiteGpuDelegateV2Delete};
            target = impl_->delegate.get();
#endif
            break;
        }
        case InferenceFramework::TfliteNnapi: {
#ifdef __ANDROID__
            impl_->nnapi_delegate = std::make_unique<tflite::StatefulNnApiDelegate>();
            target = impl_->nnapi_delegate.get();
#endif
            break;
        }
        case InferenceFramework::TfliteMetal: {
#ifdef __APPLE__
            TFLGpuDelegateOptions options = TFLGpuDelegateOptionsDefault();
            impl_->delegate = {TFLGpuDelegateCreate(&options), TFLGpuDelegateDelete};
            target = impl_->delegate.get();
#endif
            break;
        }
        default:
            break;
    }

    if (!target) {
        if (framework() != InferenceFramework::TfliteCpu) {
            throw EngineInternalError(framework(), "delegate could not be created");
        }
        return;
    }

    if (impl_->interpreter->ModifyGraphWithDelegate(target) != kTfLiteOk) {
        throw EngineInternalError(framework(), "delegate rejected the model graph");
    }
    log("Delegate attached");
#endif
}

std::vector<float> TFLiteEngine::run(const float* input, size_t count) {
#ifndef SOUND_HAZARD_HAVE_TFLITE
    (void)input;
    (void)count;
    throw UnavailableOnPlatformError(framework(), "built without TensorFlow Lite");
#else
    tflite::Interpreter* interpreter = impl_->interpreter.get();
    const int input_index = interpreter->inputs()[0];
    TfLiteTensor* input_tensor = interpreter->tensor(input_index);

    if (input_tensor->type != kTfLiteFloat32) {
        throw EngineInternalError(framework(), "model input is not float32");
    }

    // Waveform models take [samples] or [1, samples]
    const int n = static_cast<int>(count);
    std::vector<int> shape = input_tensor->dims->size <= 1 ? std::vector<int>{n}
                                                            : std::vector<int>{1, n};
    bool same_shape = input_tensor->dims->size == static_cast<int>(shape.size()) &&
                      std::equal(shape.begin(), shape.end(), input_tensor->dims->data);
    if (!same_shape) {
        if (interpreter->ResizeInputTensor(input_index, shape) != kTfLiteOk ||
            interpreter->AllocateTensors() != kTfLiteOk) {
            throw EngineInternalError(framework(), "failed to resize input to " + std::to_string(count));
        }
    }

    float* input_data = interpreter->typed_input_tensor<float>(0);
    std::copy(input, input + count, input_data);

    if (interpreter->Invoke() != kTfLiteOk) {
        throw EngineInternalError(framework(), "interpreter invoke failed");
    }

    const TfLiteTensor* output = interpreter->output_tensor(0);
    if (output->type != kTfLiteFloat32) {
        throw EngineInternalError(framework(), "model output is not float32");
    }
    const size_t total = output->bytes / sizeof(float);
    const size_t cols = output->dims->size >= 2 ? static_cast<size_t>(output->dims->data[output->dims->size - 1])
                                                : total;
    const size_t rows = cols > 0 ? total / cols : 0;
    return audio::mean_over_frames(output->data.f, rows, cols);
#endif
}

void TFLiteEngine::release() noexcept {
#ifdef SOUND_HAZARD_HAVE_TFLITE
    impl_->interpreter.reset();
    impl_->model.reset();
    impl_->delegate.reset();
#ifdef __ANDROID__
    impl_->nnapi_delegate.reset();
#endif
#endif
}

} // namespace sound_hazard
