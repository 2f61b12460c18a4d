#include "inference_engine.hpp"
#include "audio_features.hpp"
#include "inference_errors.hpp"
#include <iostream>

namespace sound_hazard {

InferenceEngine::InferenceEngine(InferenceFramework framework, const InferenceConfig& config,
                                 const PlatformInfo& platform)
    : framework_(framework), config_(config), platform_(platform) {}

void InferenceEngine::initialize() {
    if (initialized_) {
        return;
    }

    if (!is_available()) {
        throw UnavailableOnPlatformError(framework_, unavailable_reason());
    }

    const std::string path = model_path();
    if (path.empty()) {
        if (!config_.placeholder_when_model_missing) {
            throw EngineInternalError(framework_, "no model file configured");
        }
        placeholder_ = true;
        initialized_ = true;
        log("No model configured, using placeholder scoring");
        return;
    }

    try {
        load(path);
    } catch (const InferenceError&) {
        release();
        throw;
    } catch (const std::exception& e) {
        release();
        throw EngineInternalError(framework_, e.what());
    }

    placeholder_ = false;
    initialized_ = true;
    log("Initialized with model " + path);
}

InferenceResult InferenceEngine::infer(const std::vector<double>& samples) {
    if (!initialized_) {
        throw NotInitializedError(display_name(framework_) + " engine not initialized");
    }

    if (samples.empty()) {
        return audio::empty_input_result(framework_, config_.labels);
    }

    ScratchBuffer input(samples.begin(), samples.end(),
                        MemoryManager::TrackedAllocator<float>(scratch_tag()));
    const double db_level = audio::level_db(audio::rms(input.data(), input.size()));

    try {
        if (placeholder_) {
            auto scores = audio::placeholder_scores(input.data(), input.size(), config_.labels);
            return audio::build_result(framework_, scores, config_.labels, db_level,
                                       input.size(), "placeholder");
        }

        auto scores = run(input.data(), input.size());
        return audio::build_result(framework_, scores, config_.labels, db_level,
                                   input.size(), "model");
    } catch (const InferenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw EngineInternalError(framework_, e.what());
    }
}

void InferenceEngine::dispose() noexcept {
    if (!initialized_) {
        return;
    }

    if (!placeholder_) {
        release();
    }
    initialized_ = false;
    placeholder_ = false;
}

std::string InferenceEngine::unavailable_reason() const {
    return "unsupported on " + to_string(platform_.kind);
}

void InferenceEngine::log(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[" << display_name(framework_) << "] " << message << std::endl;
    }
}

} // namespace sound_hazard
