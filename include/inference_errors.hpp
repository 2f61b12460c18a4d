#pragma once

#include "inference_framework.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sound_hazard {

// Base for every error raised by the inference layer
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& message)
        : std::runtime_error(message) {}
};

// The engine's hardware or OS feature is absent. Triggers fallback.
class UnavailableOnPlatformError : public InferenceError {
public:
    UnavailableOnPlatformError(InferenceFramework framework, const std::string& reason);

    InferenceFramework framework() const { return framework_; }

private:
    InferenceFramework framework_;
};

// infer() called without a successfully initialized engine
class NotInitializedError : public InferenceError {
public:
    explicit NotInitializedError(const std::string& message = "Inference engine not initialized")
        : InferenceError(message) {}
};

// Failure inside a runtime (model load, delegate, invoke)
class EngineInternalError : public InferenceError {
public:
    EngineInternalError(InferenceFramework framework, const std::string& reason);

    InferenceFramework framework() const { return framework_; }

private:
    InferenceFramework framework_;
};

struct FrameworkFailure {
    InferenceFramework framework;
    std::string message;
};

// Every candidate of the fallback sequence failed
class AllFrameworksExhaustedError : public InferenceError {
public:
    explicit AllFrameworksExhaustedError(std::vector<FrameworkFailure> failures);

    const std::vector<FrameworkFailure>& failures() const { return failures_; }

private:
    static std::string build_message(const std::vector<FrameworkFailure>& failures);

    std::vector<FrameworkFailure> failures_;
};

} // namespace sound_hazard
