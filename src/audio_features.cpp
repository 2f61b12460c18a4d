#include "audio_features.hpp"
#include <algorithm>
#include <cmath>

namespace sound_hazard {
namespace audio {

namespace {

// -1 when the label set has no such class
int label_index(const std::vector<std::string>& labels, const std::string& name) {
    auto it = std::find(labels.begin(), labels.end(), name);
    return it != labels.end() ? static_cast<int>(it - labels.begin()) : -1;
}

std::string label_for(const std::vector<std::string>& labels, int index) {
    if (index >= 0 && static_cast<size_t>(index) < labels.size()) {
        return labels[index];
    }
    return "class_" + std::to_string(index);
}

// Pick among three labels by zero-crossing rate: tonal, voiced, broadband
const char* by_zcr(double zcr, const char* tonal, const char* voiced, const char* broadband) {
    if (zcr < 0.05) return tonal;
    if (zcr < 0.25) return voiced;
    return broadband;
}

} // namespace

double rms(const float* samples, size_t count) {
    if (count == 0) return 0.0;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return std::sqrt(sum / static_cast<double>(count));
}

double level_db(double rms_value) {
    if (rms_value <= 0.0) return 0.0;
    double db = 20.0 * std::log10(rms_value) + 90.0;
    return std::clamp(db, 0.0, kMaxDb);
}

double zero_crossing_rate(const float* samples, size_t count) {
    if (count < 2) return 0.0;

    size_t crossings = 0;
    for (size_t i = 1; i < count; ++i) {
        if ((samples[i - 1] >= 0.0f) != (samples[i] >= 0.0f)) {
            ++crossings;
        }
    }
    return static_cast<double>(crossings) / static_cast<double>(count - 1);
}

std::vector<float> placeholder_scores(const float* samples, size_t count,
                                      const std::vector<std::string>& labels) {
    if (labels.empty()) return {};

    double level = level_db(rms(samples, count));
    double zcr = zero_crossing_rate(samples, count);

    const char* label;
    double confidence;
    if (level < kSilenceDb) {
        label = "Silence";
        confidence = 0.8 + 0.2 * (1.0 - level / kSilenceDb);
    } else if (level < kBackgroundDb) {
        label = "Noise";
        confidence = 0.7 + 0.25 * (level - kSilenceDb) / (kBackgroundDb - kSilenceDb);
    } else if (level < kLoudDb) {
        label = by_zcr(zcr, "Music", "Speech", "Noise");
        confidence = 0.6 + 0.35 * (level - kBackgroundDb) / (kLoudDb - kBackgroundDb);
    } else {
        label = by_zcr(zcr, "Siren", "Alarm", "Explosion");
        confidence = 0.5 + 0.45 * std::min(1.0, (level - kLoudDb) / (kMaxDb - kLoudDb));
    }
    confidence = std::clamp(confidence, 0.0, 1.0);

    const int index = label_index(labels, label);
    if (index < 0) {
        return {};
    }

    std::vector<float> scores(labels.size(), 1.0f);
    if (labels.size() > 1) {
        float rest = static_cast<float>((1.0 - confidence) / static_cast<double>(labels.size() - 1));
        std::fill(scores.begin(), scores.end(), rest);
        scores[index] = static_cast<float>(confidence);
    }
    return scores;
}

std::vector<float> mean_over_frames(const float* data, size_t rows, size_t cols) {
    std::vector<float> scores(cols, 0.0f);
    if (rows == 0 || cols == 0) return scores;

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            scores[c] += data[r * cols + c];
        }
    }
    for (auto& score : scores) {
        score /= static_cast<float>(rows);
    }
    return scores;
}

nlohmann::json build_result(InferenceFramework framework,
                            const std::vector<float>& scores,
                            const std::vector<std::string>& labels,
                            double db_level,
                            size_t num_samples,
                            const std::string& mode) {
    int class_index = -1;
    double confidence = 0.0;
    if (!scores.empty()) {
        auto max_it = std::max_element(scores.begin(), scores.end());
        class_index = static_cast<int>(max_it - scores.begin());
        confidence = *max_it;
    }

    nlohmann::json result;
    result["framework"] = to_string(framework);
    result["mode"] = mode;
    result["class_index"] = class_index;
    result["label"] = class_index >= 0 ? label_for(labels, class_index) : "Unknown";
    result["confidence"] = confidence;
    result["scores"] = std::vector<double>(scores.begin(), scores.end());
    result["db_level"] = db_level;
    result["num_samples"] = num_samples;
    return result;
}

nlohmann::json empty_input_result(InferenceFramework framework,
                                  const std::vector<std::string>& labels) {
    const int class_index = label_index(labels, "Silence");

    nlohmann::json result;
    result["framework"] = to_string(framework);
    result["mode"] = "empty_input";
    result["class_index"] = class_index;
    result["label"] = class_index >= 0 ? label_for(labels, class_index) : "Unknown";
    result["confidence"] = class_index >= 0 ? 1.0 : 0.0;
    result["scores"] = nlohmann::json::array();
    result["db_level"] = 0.0;
    result["num_samples"] = 0;
    return result;
}

} // namespace audio
} // namespace sound_hazard
