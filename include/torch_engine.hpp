#pragma once

#include "inference_engine.hpp"
#include <memory>

namespace sound_hazard {

// TorchScript module executed with libtorch (PyTorch Mobile on Android/iOS)
class PyTorchMobileEngine : public InferenceEngine {
public:
    PyTorchMobileEngine(const InferenceConfig& config, const PlatformInfo& platform);
    ~PyTorchMobileEngine() override;

    bool is_available() const override;

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
