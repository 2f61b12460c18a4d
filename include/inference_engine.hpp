#pragma once

#include "inference_config.hpp"
#include "inference_framework.hpp"
#include "memory_manager.hpp"
#include "platform.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sound_hazard {

// Engine-specific mapping of result keys to values; not normalized by the manager
using InferenceResult = nlohmann::json;

// Per-call float copy of the input window, accounted by MemoryManager
using ScratchBuffer = std::vector<float, MemoryManager::TrackedAllocator<float>>;

/**
 * One session over one inference runtime.
 *
 * The public calls hold the lifecycle rules (availability check, placeholder
 * mode, empty input, error classification). Runtimes implement the protected
 * hooks. Derived destructors must call dispose().
 */
class InferenceEngine {
public:
    InferenceEngine(InferenceFramework framework, const InferenceConfig& config,
                    const PlatformInfo& platform);
    virtual ~InferenceEngine() = default;

    // Throws UnavailableOnPlatformError or EngineInternalError. No-op when initialized.
    void initialize();

    // Throws NotInitializedError before initialize(). Empty input yields a degenerate result.
    InferenceResult infer(const std::vector<double>& samples);

    // Idempotent, writes no log output
    void dispose() noexcept;

    // Static platform compatibility, independent of initialize()
    virtual bool is_available() const = 0;

    InferenceFramework framework() const { return framework_; }
    bool is_initialized() const { return initialized_; }
    bool is_placeholder() const { return placeholder_; }

protected:
    virtual std::string model_path() const = 0;
    virtual void load(const std::string& model_path) = 0;
    // Scores for one window, averaged over model frames
    virtual std::vector<float> run(const float* input, size_t count) = 0;
    // Must tolerate a partially completed load()
    virtual void release() noexcept = 0;
    virtual std::string unavailable_reason() const;

    const InferenceConfig& config() const { return config_; }
    const PlatformInfo& platform() const { return platform_; }
    void log(const std::string& message) const;

private:
    std::string scratch_tag() const { return "scratch/" + to_string(framework_); }

    InferenceFramework framework_;
    InferenceConfig config_;
    PlatformInfo platform_;
    bool initialized_{false};
    bool placeholder_{false};

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;
};

} // namespace sound_hazard
