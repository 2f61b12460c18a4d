#pragma once

#include "inference_framework.hpp"
#include "platform.hpp"
#include <vector>

namespace sound_hazard {

// Default framework for a platform:
//   iOS -> coreml, Android -> tflite_gpu, Web -> tflite_cpu, Desktop -> onnx_runtime
InferenceFramework select_preferred_framework(const PlatformInfo& platform);

// Ordered alternatives to try after `failed`, never containing `failed`
std::vector<InferenceFramework> fallback_sequence(InferenceFramework failed,
                                                  const PlatformInfo& platform);

} // namespace sound_hazard
