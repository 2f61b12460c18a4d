#include "inference_errors.hpp"
#include "inference_manager.hpp"
#include "memory_manager.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <stdexcept>

using json = nlohmann::json;

constexpr double kPi = 3.14159265358979323846;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -f, --framework TAG    Preferred framework (default: platform policy)\n"
              << "  -c, --config FILE      JSON configuration file\n"
              << "  -p, --platform NAME    Simulate platform: android, ios, web, desktop\n"
              << "  --tone HZ              Test tone frequency (default: 440)\n"
              << "  --amplitude A          Test tone amplitude 0..1 (default: 0.5)\n"
              << "  --noise A              Added white noise amplitude (default: 0)\n"
              << "  --benchmark            Benchmark all frameworks instead of classifying\n"
              << "  --warmup NUM           Benchmark warm-up runs\n"
              << "  --runs NUM             Benchmark timed runs\n"
              << "  --report               Print the markdown report (benchmark mode)\n"
              << "  --list                 List frameworks and availability\n"
              << "  --output FILE          Output JSON file\n"
              << "  -h, --help             Show this help\n";
}

// One window of a sine tone with optional white noise, clipped to [-1, 1]
std::vector<double> synthesize_window(size_t count, int sample_rate, double tone_hz,
                                      double amplitude, double noise) {
    std::mt19937 gen(42);
    std::uniform_real_distribution<double> dis(-1.0, 1.0);

    std::vector<double> samples(count);
    for (size_t i = 0; i < count; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        double value = amplitude * std::sin(2.0 * kPi * tone_hz * t);
        if (noise > 0.0) {
            value += noise * dis(gen);
        }
        samples[i] = std::max(-1.0, std::min(1.0, value));
    }
    return samples;
}

void write_output(const json& output_json, const std::string& output_file) {
    if (output_file.empty()) {
        std::cout << output_json.dump(2) << std::endl;
        return;
    }

    std::ofstream file(output_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write output file: " + output_file);
    }
    file << output_json.dump(2);
    std::cout << "Results saved to: " << output_file << std::endl;
}

int main(int argc, char* argv[]) {
    std::string framework_tag;
    std::string config_path;
    std::string platform_name;
    std::string output_file;
    double tone_hz = 440.0;
    double amplitude = 0.5;
    double noise = 0.0;
    int warmup_runs = -1;
    int benchmark_runs = -1;
    bool benchmark_mode = false;
    bool print_report = false;
    bool list_only = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-f" || arg == "--framework") {
                if (++i < argc) framework_tag = argv[i];
            } else if (arg == "-c" || arg == "--config") {
                if (++i < argc) config_path = argv[i];
            } else if (arg == "-p" || arg == "--platform") {
                if (++i < argc) platform_name = argv[i];
            } else if (arg == "--tone") {
                if (++i < argc) tone_hz = std::stod(argv[i]);
            } else if (arg == "--amplitude") {
                if (++i < argc) amplitude = std::stod(argv[i]);
            } else if (arg == "--noise") {
                if (++i < argc) noise = std::stod(argv[i]);
            } else if (arg == "--benchmark") {
                benchmark_mode = true;
            } else if (arg == "--warmup") {
                if (++i < argc) warmup_runs = std::stoi(argv[i]);
            } else if (arg == "--runs") {
                if (++i < argc) benchmark_runs = std::stoi(argv[i]);
            } else if (arg == "--report") {
                print_report = true;
            } else if (arg == "--list") {
                list_only = true;
            } else if (arg == "--output") {
                if (++i < argc) output_file = argv[i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    try {
        sound_hazard::InferenceConfig config;
        if (!config_path.empty()) {
            config = sound_hazard::InferenceConfig::load_from_file(config_path);
        }
        if (warmup_runs >= 0) config.warmup_runs = warmup_runs;
        if (benchmark_runs >= 0) config.benchmark_runs = benchmark_runs;

        std::shared_ptr<const sound_hazard::PlatformProvider> platform;
        if (platform_name.empty()) {
            platform = std::make_shared<sound_hazard::HostPlatformProvider>();
        } else {
            platform = std::make_shared<sound_hazard::StaticPlatformProvider>(
                sound_hazard::platform_kind_from_string(platform_name));
        }

        sound_hazard::InferenceManager manager(config, platform);
        const std::string platform_label = sound_hazard::to_string(platform->current().kind);

        if (list_only) {
            auto available = manager.get_available_frameworks();

            json list_json = json::array();
            for (auto framework : sound_hazard::kAllFrameworks) {
                bool is_available = std::find(available.begin(), available.end(), framework) != available.end();
                list_json.push_back({
                    {"framework", sound_hazard::to_string(framework)},
                    {"name", sound_hazard::display_name(framework)},
                    {"available", is_available},
                });
            }

            json output_json;
            output_json["platform"] = platform_label;
            output_json["frameworks"] = list_json;
            write_output(output_json, output_file);
            return 0;
        }

        const auto& active_config = manager.config();
        auto samples = synthesize_window(active_config.window_size, active_config.sample_rate,
                                         tone_hz, amplitude, noise);

        if (benchmark_mode) {
            auto report = manager.benchmark(samples);

            if (print_report) {
                std::cout << report.to_markdown() << std::endl;
            }

            json output_json = report.to_json();
            output_json["platform"] = platform_label;
            write_output(output_json, output_file);
            return 0;
        }

        std::optional<sound_hazard::InferenceFramework> preferred;
        if (!framework_tag.empty()) {
            preferred = sound_hazard::framework_from_string(framework_tag);
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        manager.initialize(preferred);
        auto result = manager.infer(samples);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        json output_json;
        output_json["platform"] = platform_label;
        output_json["requested"] = framework_tag.empty() ? json() : json(framework_tag);
        output_json["framework"] = sound_hazard::to_string(*manager.current_framework());
        output_json["result"] = result;
        output_json["total_time_ms"] = total_time.count();

        manager.dispose();
        write_output(output_json, output_file);

        if (active_config.verbose) {
            sound_hazard::MemoryManager::instance().report();
        }

    } catch (const sound_hazard::AllFrameworksExhaustedError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        for (const auto& failure : e.failures()) {
            std::cerr << "  " << sound_hazard::to_string(failure.framework) << ": " << failure.message << std::endl;
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
