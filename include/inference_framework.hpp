#pragma once

#include <array>
#include <string>

namespace sound_hazard {

enum class InferenceFramework {
    TfliteCpu,
    TfliteGpu,
    TfliteNnapi,
    TfliteMetal,
    OnnxRuntime,
    CoreMl,
    PytorchMobile,
};

constexpr std::array<InferenceFramework, 7> kAllFrameworks = {
    InferenceFramework::TfliteCpu,
    InferenceFramework::TfliteGpu,
    InferenceFramework::TfliteNnapi,
    InferenceFramework::TfliteMetal,
    InferenceFramework::OnnxRuntime,
    InferenceFramework::CoreMl,
    InferenceFramework::PytorchMobile,
};

// Stable tag used in results, configs and the CLI ("tflite_cpu", ...)
std::string to_string(InferenceFramework framework);

// Human readable name ("TensorFlow Lite (GPU Delegate)")
std::string display_name(InferenceFramework framework);

// Parse a tag, case-insensitive. Throws std::invalid_argument.
InferenceFramework framework_from_string(const std::string& tag);

} // namespace sound_hazard
