#include "engine_factory.hpp"
#include "onnx_engine.hpp"
#include "tflite_engine.hpp"
#include "torch_engine.hpp"
#include <stdexcept>

namespace sound_hazard {

// No default case: a new InferenceFramework value fails the build (-Werror=switch)
std::unique_ptr<InferenceEngine> create_engine(InferenceFramework framework,
                                               const InferenceConfig& config,
                                               const PlatformInfo& platform) {
    switch (framework) {
        case InferenceFramework::TfliteCpu:
        case InferenceFramework::TfliteGpu:
        case InferenceFramework::TfliteNnapi:
        case InferenceFramework::TfliteMetal:
            return std::make_unique<TFLiteEngine>(framework, config, platform);
        case InferenceFramework::OnnxRuntime:
        case InferenceFramework::CoreMl:
            return std::make_unique<OnnxRuntimeEngine>(framework, config, platform);
        case InferenceFramework::PytorchMobile:
            return std::make_unique<PyTorchMobileEngine>(config, platform);
    }
    throw std::invalid_argument("Unknown inference framework value");
}

EngineFactory make_engine_factory(const InferenceConfig& config,
                                  std::shared_ptr<const PlatformProvider> platform) {
    if (!platform) {
        throw std::invalid_argument("Engine factory needs a platform provider");
    }
    return [config, platform](InferenceFramework framework) {
        return create_engine(framework, config, platform->current());
    };
}

std::vector<InferenceFramework> available_frameworks(const InferenceConfig& config,
                                                     const PlatformInfo& platform) {
    std::vector<InferenceFramework> available;
    for (auto framework : kAllFrameworks) {
        if (is_framework_available(framework, config, platform)) {
            available.push_back(framework);
        }
    }
    return available;
}

bool is_framework_available(InferenceFramework framework,
                            const InferenceConfig& config,
                            const PlatformInfo& platform) {
    return create_engine(framework, config, platform)->is_available();
}

} // namespace sound_hazard
