#include "benchmark_harness.hpp"
#include "inference_errors.hpp"
#include "memory_manager.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sound_hazard {

namespace {

std::string format_ms(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string format_time(std::chrono::system_clock::time_point tp, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string iso8601(std::chrono::system_clock::time_point tp) {
    return format_time(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace

BenchmarkResult::BenchmarkResult(InferenceFramework framework,
                                 double avg_ms,
                                 double min_ms,
                                 double max_ms,
                                 double memory_usage_mb,
                                 int iterations,
                                 std::chrono::system_clock::time_point timestamp)
    : framework_(framework), avg_ms_(avg_ms), min_ms_(min_ms), max_ms_(max_ms),
      memory_usage_mb_(memory_usage_mb), iterations_(iterations), timestamp_(timestamp) {}

std::string BenchmarkResult::to_string() const {
    std::ostringstream oss;
    oss << "Framework: " << sound_hazard::to_string(framework_) << "\n"
        << "Avg: " << format_ms(avg_ms_) << "ms\n"
        << "Min: " << format_ms(min_ms_) << "ms\n"
        << "Max: " << format_ms(max_ms_) << "ms\n";
    return oss.str();
}

nlohmann::json BenchmarkResult::to_json() const {
    nlohmann::json j;
    j["framework"] = sound_hazard::to_string(framework_);
    j["avg_inference_ms"] = avg_ms_;
    j["min_inference_ms"] = min_ms_;
    j["max_inference_ms"] = max_ms_;
    j["memory_usage_mb"] = memory_usage_mb_;
    j["iterations"] = iterations_;
    j["timestamp"] = iso8601(timestamp_);
    return j;
}

std::string to_string(BenchmarkSkipReason reason) {
    switch (reason) {
        case BenchmarkSkipReason::Unavailable:
            return "unavailable";
        case BenchmarkSkipReason::InitializationFailed:
            return "initialization_failed";
        case BenchmarkSkipReason::InferenceFailed:
            return "inference_failed";
    }
    return "unknown";
}

std::optional<BenchmarkResult> BenchmarkReport::fastest() const {
    std::optional<BenchmarkResult> best;
    for (const auto& [framework, result] : results) {
        if (!best || result.avg_inference_ms() < best->avg_inference_ms()) {
            best = result;
        }
    }
    return best;
}

std::string BenchmarkReport::to_markdown() const {
    std::vector<BenchmarkResult> sorted;
    for (const auto& [framework, result] : results) {
        sorted.push_back(result);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const BenchmarkResult& a, const BenchmarkResult& b) {
                         return a.avg_inference_ms() < b.avg_inference_ms();
                     });

    // Stamped with the last measurement, or the current time for an empty report
    auto generated = std::chrono::system_clock::now();
    if (!sorted.empty()) {
        generated = std::max_element(sorted.begin(), sorted.end(),
                                     [](const BenchmarkResult& a, const BenchmarkResult& b) {
                                         return a.timestamp() < b.timestamp();
                                     })->timestamp();
    }

    std::ostringstream md;
    md << "# Inference Engine Benchmark Report\n";
    md << "Generated: " << format_time(generated, "%Y-%m-%d %H:%M:%S UTC") << "\n\n";

    md << "## Results (sorted by average inference time)\n\n";
    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& result = sorted[i];
        md << "### " << (i + 1) << ". " << display_name(result.framework()) << "\n";
        md << "- **Average Inference Time**: " << format_ms(result.avg_inference_ms()) << " ms\n";
        md << "- **Min Inference Time**: " << format_ms(result.min_inference_ms()) << " ms\n";
        md << "- **Max Inference Time**: " << format_ms(result.max_inference_ms()) << " ms\n";
        md << "- **Memory Usage**: " << format_ms(result.memory_usage_mb()) << " MB\n";
        md << "- **Iterations**: " << result.iterations() << "\n\n";
    }

    if (!skipped.empty()) {
        md << "## Skipped\n\n";
        for (const auto& skip : skipped) {
            md << "- **" << display_name(skip.framework) << "** ("
               << to_string(skip.reason) << "): " << skip.message << "\n";
        }
        md << "\n";
    }

    if (!sorted.empty()) {
        const auto& winner = sorted.front();
        md << "## Winner: " << display_name(winner.framework()) << "\n";
        md << "Fastest average inference time: " << format_ms(winner.avg_inference_ms()) << " ms\n";
    }

    return md.str();
}

nlohmann::json BenchmarkReport::to_json() const {
    nlohmann::json j;
    j["results"] = nlohmann::json::object();
    for (const auto& [framework, result] : results) {
        j["results"][to_string(framework)] = result.to_json();
    }

    j["skipped"] = nlohmann::json::array();
    for (const auto& skip : skipped) {
        j["skipped"].push_back({
            {"framework", to_string(skip.framework)},
            {"reason", to_string(skip.reason)},
            {"message", skip.message},
        });
    }

    auto best = fastest();
    j["fastest"] = best ? nlohmann::json(to_string(best->framework())) : nlohmann::json();
    return j;
}

BenchmarkHarness::BenchmarkHarness(EngineFactory factory, int warmup_runs, int benchmark_runs)
    : factory_(std::move(factory)), warmup_runs_(warmup_runs), benchmark_runs_(benchmark_runs) {
    if (!factory_) {
        throw std::invalid_argument("BenchmarkHarness needs an engine factory");
    }
    if (warmup_runs_ < 0) {
        throw std::invalid_argument("warmup_runs must be >= 0");
    }
    if (benchmark_runs_ < 1) {
        throw std::invalid_argument("benchmark_runs must be >= 1");
    }
}

BenchmarkReport BenchmarkHarness::run(const std::vector<double>& samples) const {
    return run(samples, std::vector<InferenceFramework>(kAllFrameworks.begin(), kAllFrameworks.end()));
}

BenchmarkReport BenchmarkHarness::run(const std::vector<double>& samples,
                                      const std::vector<InferenceFramework>& frameworks) const {
    BenchmarkReport report;

    for (auto framework : frameworks) {
        std::cout << "[BenchmarkHarness] Benchmarking " << display_name(framework) << "..." << std::endl;

        std::unique_ptr<InferenceEngine> engine;
        try {
            engine = factory_(framework);
            if (!engine) {
                throw std::runtime_error("factory returned no engine");
            }
            engine->initialize();
        } catch (const UnavailableOnPlatformError& e) {
            std::cerr << "[BenchmarkHarness] Skipping " << to_string(framework) << ": " << e.what() << std::endl;
            report.skipped.push_back({framework, BenchmarkSkipReason::Unavailable, e.what()});
            continue;
        } catch (const std::exception& e) {
            std::cerr << "[BenchmarkHarness] Failed to initialize " << to_string(framework) << ": " << e.what() << std::endl;
            if (engine) {
                engine->dispose();
            }
            report.skipped.push_back({framework, BenchmarkSkipReason::InitializationFailed, e.what()});
            continue;
        }

        try {
            auto result = measure(*engine, samples);
            report.results.emplace(framework, result);
        } catch (const std::exception& e) {
            std::cerr << "[BenchmarkHarness] Inference failed on " << to_string(framework) << ": " << e.what() << std::endl;
            report.skipped.push_back({framework, BenchmarkSkipReason::InferenceFailed, e.what()});
        }

        engine->dispose();
    }

    return report;
}

BenchmarkResult BenchmarkHarness::measure(InferenceEngine& engine, const std::vector<double>& samples) const {
    auto& memory_manager = MemoryManager::instance();

    for (int i = 0; i < warmup_runs_; ++i) {
        engine.infer(samples);
    }

    const size_t baseline = memory_manager.get_total_allocated();
    memory_manager.reset_peak();

    double total_ms = 0.0;
    double min_ms = std::numeric_limits<double>::max();
    double max_ms = 0.0;

    for (int i = 0; i < benchmark_runs_; ++i) {
        auto start = std::chrono::high_resolution_clock::now();

        engine.infer(samples);

        auto end = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

        total_ms += elapsed_ms;
        min_ms = std::min(min_ms, elapsed_ms);
        max_ms = std::max(max_ms, elapsed_ms);
    }

    const size_t peak = memory_manager.get_peak_usage();
    const double memory_mb = peak > baseline
        ? static_cast<double>(peak - baseline) / (1024.0 * 1024.0)
        : 0.0;

    // Summation order can leave the mean a hair outside [min, max]
    double avg_ms = total_ms / benchmark_runs_;
    avg_ms = std::min(std::max(avg_ms, min_ms), max_ms);

    return BenchmarkResult(engine.framework(), avg_ms, min_ms, max_ms, memory_mb, benchmark_runs_);
}

} // namespace sound_hazard
