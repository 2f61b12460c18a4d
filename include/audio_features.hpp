#pragma once

#include "inference_framework.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sound_hazard {
namespace audio {

// Level below which a window counts as silence
constexpr double kSilenceDb = 30.0;
constexpr double kBackgroundDb = 50.0;
constexpr double kLoudDb = 70.0;
constexpr double kMaxDb = 120.0;

double rms(const float* samples, size_t count);

// Approximate sound level in dB for full-scale [-1, 1] samples, clamped to [0, 120]
double level_db(double rms_value);

// Fraction of adjacent sample pairs that change sign
double zero_crossing_rate(const float* samples, size_t count);

// Deterministic level/ZCR classifier used when no model file is configured.
// Returns one score per label, summing to 1, or no scores when the label set
// lacks the class the heuristic picked.
std::vector<float> placeholder_scores(const float* samples, size_t count,
                                      const std::vector<std::string>& labels);

// Average a [rows x cols] score matrix (one row per model frame) into cols scores
std::vector<float> mean_over_frames(const float* data, size_t rows, size_t cols);

// Top-1 result object shared by all engines
nlohmann::json build_result(InferenceFramework framework,
                            const std::vector<float>& scores,
                            const std::vector<std::string>& labels,
                            double db_level,
                            size_t num_samples,
                            const std::string& mode);

// Degenerate result for an empty sample window: "Silence", or "Unknown" when
// the label set has no such class
nlohmann::json empty_input_result(InferenceFramework framework,
                                  const std::vector<std::string>& labels);

} // namespace audio
} // namespace sound_hazard
