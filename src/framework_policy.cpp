#include "framework_policy.hpp"
#include <algorithm>

namespace sound_hazard {

InferenceFramework select_preferred_framework(const PlatformInfo& platform) {
    switch (platform.kind) {
        case PlatformKind::IOS:
            return InferenceFramework::CoreMl;
        case PlatformKind::Android:
            return InferenceFramework::TfliteGpu;
        case PlatformKind::Web:
            return InferenceFramework::TfliteCpu;
        case PlatformKind::Desktop:
            return InferenceFramework::OnnxRuntime;
    }
    return InferenceFramework::OnnxRuntime;
}

std::vector<InferenceFramework> fallback_sequence(InferenceFramework failed,
                                                  const PlatformInfo& platform) {
    std::vector<InferenceFramework> sequence;

    switch (platform.kind) {
        case PlatformKind::Android:
            sequence = {
                InferenceFramework::TfliteNnapi,
                InferenceFramework::TfliteGpu,
                InferenceFramework::TfliteCpu,
                InferenceFramework::OnnxRuntime,
            };
            break;
        case PlatformKind::IOS:
            sequence = {
                InferenceFramework::TfliteMetal,
                InferenceFramework::TfliteCpu,
                InferenceFramework::OnnxRuntime,
            };
            break;
        case PlatformKind::Web:
        case PlatformKind::Desktop:
            sequence = {
                InferenceFramework::OnnxRuntime,
                InferenceFramework::TfliteCpu,
            };
            break;
    }

    sequence.erase(std::remove(sequence.begin(), sequence.end(), failed), sequence.end());
    return sequence;
}

} // namespace sound_hazard
