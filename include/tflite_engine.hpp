#pragma once

#include "inference_engine.hpp"
#include <memory>

namespace sound_hazard {

/**
 * TensorFlow Lite interpreter with one delegate per framework:
 * - TfliteCpu:   XNNPACK when compiled in, plain CPU kernels otherwise
 * - TfliteGpu:   GPU delegate v2 (OpenGL ES / OpenCL)
 * - TfliteNnapi: Android Neural Networks API
 * - TfliteMetal: Metal delegate (Apple)
 */
class TFLiteEngine : public InferenceEngine {
public:
    TFLiteEngine(InferenceFramework framework, const InferenceConfig& config,
                 const PlatformInfo& platform);
    ~TFLiteEngine() override;

    bool is_available() const override;

    // Whether TensorFlow Lite support is compiled in
    static bool is_compiled();
    // Whether the delegate a framework needs is compiled in
    static bool is_delegate_compiled(InferenceFramework framework);

protected:
    std::string model_path() const override;
    void load(const std::string& model_path) override;
    std::vector<float> run(const float* input, size_t count) override;
    void release() noexcept override;
    std::string unavailable_reason() const override;

private:
    void attach_delegate();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sound_hazard
