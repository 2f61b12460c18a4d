#include "benchmark_harness.hpp"
#include "engine_factory.hpp"
#include "inference_errors.hpp"
#include "inference_manager.hpp"
#include "memory_manager.hpp"
#include <algorithm>
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <iostream>
#include <random>
#include <thread>

namespace sound_hazard {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        config_.warmup_runs = 1;
        config_.benchmark_runs = 5;
        config_.num_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

        create_synthetic_window();

        platform_ = std::make_shared<HostPlatformProvider>();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        samples_.clear();
    }

protected:
    // Noisy 1 kHz tone, one model window long
    void create_synthetic_window() {
        std::mt19937 gen(7);
        std::uniform_real_distribution<double> dis(-0.1, 0.1);

        samples_.resize(config_.window_size);
        for (size_t i = 0; i < samples_.size(); ++i) {
            double t = static_cast<double>(i) / config_.sample_rate;
            samples_[i] = 0.4 * std::sin(2.0 * 3.14159265358979323846 * 1000.0 * t) + dis(gen);
        }
    }

    InferenceConfig config_;
    std::shared_ptr<const PlatformProvider> platform_;
    std::vector<double> samples_;
};

// One inference per framework, placeholder scoring unless a model is configured
BENCHMARK_DEFINE_F(BenchmarkFixture, EngineInference)(benchmark::State& state) {
    auto framework = kAllFrameworks[static_cast<size_t>(state.range(0))];
    auto engine = create_engine(framework, config_, platform_->current());

    if (!engine->is_available()) {
        state.SkipWithError(("unavailable: " + to_string(framework)).c_str());
        return;
    }
    try {
        engine->initialize();
    } catch (const InferenceError& e) {
        state.SkipWithError(("initialization failed: " + std::string(e.what())).c_str());
        return;
    }

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = engine->infer(samples_);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["confidence"] = result["confidence"].get<double>();
        state.counters["db_level"] = result["db_level"].get<double>();
    }

    state.SetLabel(display_name(framework));
    engine->dispose();
}

// Preferring the GPU delegate on desktop walks the fallback sequence every time
BENCHMARK_DEFINE_F(BenchmarkFixture, ManagerInitializeWithFallback)(benchmark::State& state) {
    auto desktop = std::make_shared<StaticPlatformProvider>(PlatformKind::Desktop);
    InferenceManager manager(config_, desktop);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        manager.initialize(InferenceFramework::TfliteGpu);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        manager.dispose();
    }
}

// Full harness pass over every framework on the host
BENCHMARK_DEFINE_F(BenchmarkFixture, HarnessRun)(benchmark::State& state) {
    BenchmarkHarness harness(make_engine_factory(config_, platform_),
                             config_.warmup_runs, config_.benchmark_runs);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto report = harness.run(samples_);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["benchmarked"] = static_cast<double>(report.results.size());
        state.counters["skipped"] = static_cast<double>(report.skipped.size());
    }
}

// Scratch buffer allocation and tracking
BENCHMARK_DEFINE_F(BenchmarkFixture, ScratchAllocation)(benchmark::State& state) {
    auto& memory_manager = MemoryManager::instance();

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        ScratchBuffer buffer(samples_.begin(), samples_.end(),
                             MemoryManager::TrackedAllocator<float>("scratch/benchmark"));
        benchmark::DoNotOptimize(buffer.data());

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["peak_usage"] = static_cast<double>(memory_manager.get_peak_usage());
    }
}

// Register benchmarks
BENCHMARK_REGISTER_F(BenchmarkFixture, EngineInference)->DenseRange(0, static_cast<int>(kAllFrameworks.size()) - 1)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, ManagerInitializeWithFallback)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, HarnessRun)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, ScratchAllocation)->UseManualTime()->Unit(benchmark::kMicrosecond);

} // namespace sound_hazard

// Custom main function to add additional reporting
int main(int argc, char** argv) {
    std::cout << "Sound Hazard Inference - Performance Benchmarks" << std::endl;
    std::cout << "===============================================" << std::endl;

    // Print system information
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;

    sound_hazard::HostPlatformProvider host;
    auto platform = host.current();
    std::cout << "  Platform: " << sound_hazard::to_string(platform.kind) << std::endl;

    // Print available inference frameworks
    auto frameworks = sound_hazard::available_frameworks(sound_hazard::InferenceConfig{}, platform);
    std::cout << "  Available Frameworks: ";
    for (size_t i = 0; i < frameworks.size(); ++i) {
        std::cout << sound_hazard::to_string(frameworks[i]);
        if (i < frameworks.size() - 1) std::cout << ", ";
    }
    std::cout << std::endl;
    std::cout << std::endl;

    // Initialize and run benchmarks
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
