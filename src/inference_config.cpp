#include "inference_config.hpp"
#include <fstream>
#include <stdexcept>

namespace sound_hazard {

std::vector<std::string> default_labels() {
    return {
        "Speech", "Music", "Noise", "Silence", "Animal", "Vehicle", "Nature",
        "Alarm", "Siren", "Applause", "Laughter", "Crying", "Footsteps",
        "Knocking", "Doorbell", "Water", "Wind", "Thunder", "Fire", "Explosion"
    };
}

bool InferenceConfig::validate() const noexcept {
    if (num_threads < 1) return false;
    if (sample_rate <= 0) return false;
    if (window_size == 0 || window_size > kMaxWindowSize) return false;
    if (labels.empty()) return false;
    if (warmup_runs < 0) return false;
    if (benchmark_runs < 1) return false;
    return true;
}

InferenceConfig InferenceConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json config_json;
    try {
        file >> config_json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    InferenceConfig config;
    try {
        config = config_json.get<InferenceConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + e.what());
    }

    if (!config.validate()) {
        throw std::invalid_argument("Config failed validation: " + path);
    }
    return config;
}

void InferenceConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write config file: " + path);
    }
    file << nlohmann::json(*this).dump(2) << "\n";
}

void to_json(nlohmann::json& j, const InferenceConfig& config) {
    j = nlohmann::json{
        {"tflite_model_path", config.tflite_model_path},
        {"onnx_model_path", config.onnx_model_path},
        {"torchscript_model_path", config.torchscript_model_path},
        {"labels", config.labels},
        {"num_threads", config.num_threads},
        {"sample_rate", config.sample_rate},
        {"window_size", config.window_size},
        {"placeholder_when_model_missing", config.placeholder_when_model_missing},
        {"enable_fallback", config.enable_fallback},
        {"warmup_runs", config.warmup_runs},
        {"benchmark_runs", config.benchmark_runs},
        {"verbose", config.verbose},
    };
}

// Missing keys keep their defaults, unknown keys are ignored
void from_json(const nlohmann::json& j, InferenceConfig& config) {
    config.tflite_model_path = j.value("tflite_model_path", config.tflite_model_path);
    config.onnx_model_path = j.value("onnx_model_path", config.onnx_model_path);
    config.torchscript_model_path = j.value("torchscript_model_path", config.torchscript_model_path);
    config.labels = j.value("labels", config.labels);
    config.num_threads = j.value("num_threads", config.num_threads);
    config.sample_rate = j.value("sample_rate", config.sample_rate);
    // Read signed so a negative size is rejected instead of wrapping
    const long long window_size = j.value("window_size", static_cast<long long>(config.window_size));
    config.window_size = window_size > 0 ? static_cast<size_t>(window_size) : 0;
    config.placeholder_when_model_missing =
        j.value("placeholder_when_model_missing", config.placeholder_when_model_missing);
    config.enable_fallback = j.value("enable_fallback", config.enable_fallback);
    config.warmup_runs = j.value("warmup_runs", config.warmup_runs);
    config.benchmark_runs = j.value("benchmark_runs", config.benchmark_runs);
    config.verbose = j.value("verbose", config.verbose);
}

} // namespace sound_hazard
