#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sound_hazard {

std::vector<std::string> default_labels();

struct InferenceConfig {
    // Model assets, one per runtime. Empty means "no model configured".
    std::string tflite_model_path;
    std::string onnx_model_path;          // also loaded by the CoreML provider
    std::string torchscript_model_path;

    std::vector<std::string> labels = default_labels();

    int num_threads = 4;
    int sample_rate = 16000;
    size_t window_size = 15600;           // 0.975 s at 16 kHz

    // One minute at 48 kHz
    static constexpr size_t kMaxWindowSize = 60 * 48000;

    // Score with the level/ZCR heuristic when the model file is not configured
    bool placeholder_when_model_missing = true;
    bool enable_fallback = true;

    int warmup_runs = 5;
    int benchmark_runs = 50;

    bool verbose = false;

    bool validate() const noexcept;

    // Throws std::runtime_error on I/O or parse failure,
    // std::invalid_argument when the loaded values do not validate
    static InferenceConfig load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

void to_json(nlohmann::json& j, const InferenceConfig& config);
void from_json(const nlohmann::json& j, InferenceConfig& config);

} // namespace sound_hazard
