#include "inference_manager.hpp"
#include "framework_policy.hpp"
#include "inference_errors.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace sound_hazard {

class InferenceManager::Impl {
public:
    Impl(const InferenceConfig& config, std::shared_ptr<const PlatformProvider> platform, EngineFactory factory)
        : config_(config), platform_(std::move(platform)), factory_(std::move(factory)) {
        if (!config_.validate()) {
            throw std::invalid_argument("Invalid inference configuration");
        }
        if (!platform_) {
            throw std::invalid_argument("InferenceManager needs a platform provider");
        }
        if (!factory_) {
            factory_ = make_engine_factory(config_, platform_);
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        dispose_locked();
    }

    void initialize(std::optional<InferenceFramework> preferred) {
        std::lock_guard<std::mutex> lock(mutex_);
        initialize_locked(preferred);
    }

    InferenceResult infer(const std::vector<double>& samples) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!engine_) {
            throw NotInitializedError();
        }
        return engine_->infer(samples);
    }

    void switch_framework(InferenceFramework framework) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (engine_ && engine_->framework() == framework) {
            return;
        }
        initialize_locked(framework);
    }

    void dispose() {
        std::lock_guard<std::mutex> lock(mutex_);
        dispose_locked();
    }

    std::optional<InferenceFramework> current_framework() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!engine_) {
            return std::nullopt;
        }
        return engine_->framework();
    }

    BenchmarkReport benchmark(const std::vector<double>& samples) const {
        BenchmarkHarness harness(factory_, config_.warmup_runs, config_.benchmark_runs);
        return harness.run(samples);
    }

    std::vector<InferenceFramework> get_available_frameworks() const {
        std::vector<InferenceFramework> available;
        for (auto framework : kAllFrameworks) {
            auto engine = factory_(framework);
            if (engine && engine->is_available()) {
                available.push_back(framework);
            }
        }
        return available;
    }

    const InferenceConfig& config() const { return config_; }

private:
    void initialize_locked(std::optional<InferenceFramework> preferred) {
        dispose_locked();

        const PlatformInfo platform = platform_->current();
        const InferenceFramework target = preferred.value_or(select_preferred_framework(platform));

        std::vector<FrameworkFailure> failures;
        try {
            adopt(target);
            return;
        } catch (const std::exception& e) {
            report_failure(target, e.what());
            if (!config_.enable_fallback) {
                throw;
            }
            failures.push_back({target, e.what()});
        }

        for (auto candidate : fallback_sequence(target, platform)) {
            std::cout << "[InferenceManager] Falling back to " << display_name(candidate) << std::endl;
            try {
                adopt(candidate);
                return;
            } catch (const std::exception& e) {
                report_failure(candidate, e.what());
                failures.push_back({candidate, e.what()});
            }
        }

        throw AllFrameworksExhaustedError(std::move(failures));
    }

    // Constructs and initializes; the manager only takes ownership on success
    void adopt(InferenceFramework framework) {
        auto engine = factory_(framework);
        if (!engine) {
            throw EngineInternalError(framework, "engine factory returned no engine");
        }
        engine->initialize();

        engine_ = std::move(engine);
        std::cout << "[InferenceManager] Initialized " << display_name(engine_->framework()) << std::endl;
    }

    void dispose_locked() {
        if (engine_) {
            engine_->dispose();
            engine_.reset();
        }
    }

    static void report_failure(InferenceFramework framework, const std::string& message) {
        std::cerr << "[InferenceManager] " << display_name(framework)
                  << " failed to initialize: " << message << std::endl;
    }

    InferenceConfig config_;
    std::shared_ptr<const PlatformProvider> platform_;
    EngineFactory factory_;

    mutable std::mutex mutex_;
    std::unique_ptr<InferenceEngine> engine_;
};

InferenceManager::InferenceManager(const InferenceConfig& config,
                                   std::shared_ptr<const PlatformProvider> platform,
                                   EngineFactory factory)
    : pimpl_(std::make_shared<Impl>(config, std::move(platform), std::move(factory))) {}

InferenceManager::~InferenceManager() = default;

void InferenceManager::initialize(std::optional<InferenceFramework> preferred) {
    pimpl_->initialize(preferred);
}

InferenceResult InferenceManager::infer(const std::vector<double>& samples) {
    return pimpl_->infer(samples);
}

std::future<InferenceResult> InferenceManager::infer_async(std::vector<double> samples) {
    return std::async(std::launch::async, [impl = pimpl_, samples = std::move(samples)]() {
        return impl->infer(samples);
    });
}

void InferenceManager::switch_framework(InferenceFramework framework) {
    pimpl_->switch_framework(framework);
}

void InferenceManager::dispose() {
    pimpl_->dispose();
}

std::optional<InferenceFramework> InferenceManager::current_framework() const {
    return pimpl_->current_framework();
}

bool InferenceManager::is_ready() const {
    return pimpl_->current_framework().has_value();
}

std::map<InferenceFramework, BenchmarkResult> InferenceManager::benchmark_all(const std::vector<double>& samples) const {
    return pimpl_->benchmark(samples).results;
}

BenchmarkReport InferenceManager::benchmark(const std::vector<double>& samples) const {
    return pimpl_->benchmark(samples);
}

std::vector<InferenceFramework> InferenceManager::get_available_frameworks() const {
    return pimpl_->get_available_frameworks();
}

const InferenceConfig& InferenceManager::config() const {
    return pimpl_->config();
}

} // namespace sound_hazard
