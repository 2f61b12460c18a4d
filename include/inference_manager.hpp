#pragma once

#include "benchmark_harness.hpp"
#include "engine_factory.hpp"
#include "inference_config.hpp"
#include "inference_engine.hpp"
#include "inference_framework.hpp"
#include "platform.hpp"
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace sound_hazard {

/**
 * Entry point for the application. Owns at most one active engine.
 *
 * initialize() tries the requested framework (or the platform default) and,
 * when enable_fallback is set, walks the platform's fallback sequence until
 * one engine initializes. Every call except benchmarking is serialized.
 */
class InferenceManager {
public:
    // An empty factory selects the built-in engines
    explicit InferenceManager(const InferenceConfig& config = {},
                              std::shared_ptr<const PlatformProvider> platform = std::make_shared<HostPlatformProvider>(),
                              EngineFactory factory = {});
    ~InferenceManager();

    InferenceManager(const InferenceManager&) = delete;
    InferenceManager& operator=(const InferenceManager&) = delete;

    // Throws AllFrameworksExhaustedError, or the engine's error when fallback is disabled
    void initialize(std::optional<InferenceFramework> preferred = std::nullopt);

    InferenceResult infer(const std::vector<double>& samples);
    // The pending call keeps the manager's state alive, so the future may outlive the manager
    std::future<InferenceResult> infer_async(std::vector<double> samples);

    void switch_framework(InferenceFramework framework);
    void dispose();

    std::optional<InferenceFramework> current_framework() const;
    bool is_ready() const;

    // Benchmarks run on separate engine instances
    std::map<InferenceFramework, BenchmarkResult> benchmark_all(const std::vector<double>& samples) const;
    BenchmarkReport benchmark(const std::vector<double>& samples) const;

    std::vector<InferenceFramework> get_available_frameworks() const;
    const InferenceConfig& config() const;

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace sound_hazard
