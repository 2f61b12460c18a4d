#pragma once

#include "engine_factory.hpp"
#include "inference_framework.hpp"
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sound_hazard {

// Timing statistics of one framework over one benchmark run
class BenchmarkResult {
public:
    BenchmarkResult(InferenceFramework framework,
                    double avg_ms,
                    double min_ms,
                    double max_ms,
                    double memory_usage_mb,
                    int iterations,
                    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now());

    InferenceFramework framework() const { return framework_; }
    double avg_inference_ms() const { return avg_ms_; }
    double min_inference_ms() const { return min_ms_; }
    double max_inference_ms() const { return max_ms_; }
    double memory_usage_mb() const { return memory_usage_mb_; }
    int iterations() const { return iterations_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

    // "Framework: tflite_cpu\nAvg: 25.50ms\nMin: 20.00ms\nMax: 31.25ms\n"
    std::string to_string() const;
    nlohmann::json to_json() const;

private:
    InferenceFramework framework_;
    double avg_ms_;
    double min_ms_;
    double max_ms_;
    double memory_usage_mb_;
    int iterations_;
    std::chrono::system_clock::time_point timestamp_;
};

enum class BenchmarkSkipReason {
    Unavailable,
    InitializationFailed,
    InferenceFailed,
};

std::string to_string(BenchmarkSkipReason reason);

struct BenchmarkSkip {
    InferenceFramework framework;
    BenchmarkSkipReason reason;
    std::string message;
};

struct BenchmarkReport {
    std::map<InferenceFramework, BenchmarkResult> results;
    std::vector<BenchmarkSkip> skipped;

    // Lowest average time, nullopt when nothing ran
    std::optional<BenchmarkResult> fastest() const;

    // Results sorted by average time plus a winner section
    std::string to_markdown() const;
    nlohmann::json to_json() const;
};

/**
 * Runs every requested framework on its own transient engine:
 * construct, initialize, warm up, time, dispose. One framework at a time.
 * Failures are recorded as skips and never abort the run.
 */
class BenchmarkHarness {
public:
    // Throws std::invalid_argument unless warmup_runs >= 0 and benchmark_runs >= 1
    explicit BenchmarkHarness(EngineFactory factory, int warmup_runs = 5, int benchmark_runs = 50);

    BenchmarkReport run(const std::vector<double>& samples) const;
    BenchmarkReport run(const std::vector<double>& samples,
                        const std::vector<InferenceFramework>& frameworks) const;

    int warmup_runs() const { return warmup_runs_; }
    int benchmark_runs() const { return benchmark_runs_; }

private:
    BenchmarkResult measure(InferenceEngine& engine, const std::vector<double>& samples) const;

    EngineFactory factory_;
    int warmup_runs_;
    int benchmark_runs_;
};

} // namespace sound_hazard
