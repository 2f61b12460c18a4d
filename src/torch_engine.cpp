#include "torch_engine.hpp"
#include "audio_features.hpp"
#include "inference_errors.hpp"
#include <torch/script.h>
#include <torch/torch.h>

namespace sound_hazard {

class PyTorchMobileEngine::Impl {
public:
    std::unique_ptr<torch::jit::script::Module> module;
};

PyTorchMobileEngine::PyTorchMobileEngine(const InferenceConfig& config, const PlatformInfo& platform)
    : InferenceEngine(InferenceFramework::PytorchMobile, config, platform),
      pimpl_(std::make_unique<Impl>()) {}

PyTorchMobileEngine::~PyTorchMobileEngine() {
    dispose();
}

bool PyTorchMobileEngine::is_available() const {
    return platform().is_mobile();
}

std::string PyTorchMobileEngine::unavailable_reason() const {
    return "PyTorch Mobile targets Android and iOS only";
}

std::string PyTorchMobileEngine::model_path() const {
    return config().torchscript_model_path;
}

void PyTorchMobileEngine::load(const std::string& model_path) {
    torch::set_num_threads(config().num_threads);

    pimpl_->module = std::make_unique<torch::jit::script::Module>(torch::jit::load(model_path));
    pimpl_->module->eval();
}

std::vector<float> PyTorchMobileEngine::run(const float* input, size_t count) {
    torch::NoGradGuard no_grad;

    // from_blob does not copy; the scratch buffer outlives forward()
    torch::Tensor waveform = torch::from_blob(const_cast<float*>(input),
                                              {1, static_cast<int64_t>(count)},
                                              torch::kFloat32);

    torch::Tensor output = pimpl_->module->forward({waveform}).toTensor()
                               .to(torch::kCPU, torch::kFloat32)
                               .contiguous();
    if (output.dim() == 0) {
        output = output.reshape({1});
    }

    // [frames, classes] -> [classes]
    torch::Tensor scores = output.reshape({-1, output.size(-1)}).mean(0).contiguous();
    const float* data = scores.data_ptr<float>();
    return std::vector<float>(data, data + scores.numel());
}

void PyTorchMobileEngine::release() noexcept {
    pimpl_->module.reset();
}

} // namespace sound_hazard
