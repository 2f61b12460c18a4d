#pragma once

#include "inference_engine.hpp"
#include <memory>

namespace sound_hazard {

// ONNX Runtime session. CoreMl runs the same model through the CoreML execution provider.
class OnnxRuntimeEngine : public InferenceEngine {
public:
    OnnxRuntimeEngine(InferenceFramework framework, const InferenceConfig& config,
                      const PlatformInfo& platform);
    ~OnnxRuntimeEngine() override;

    bool is_available() const override;

    // Whether the CoreML execution provider is part of this build
    static bool is_coreml_compiled();

protected:
    std::string model_path() const override;
    void load(const std::string& model_path) override;
    std::vector<float> run(const float* input, size_t count) override;
    void release() noexcept override;
    std::string unavailable_reason() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace sound_hazard
