#include "inference_errors.hpp"
#include <sstream>

namespace sound_hazard {

UnavailableOnPlatformError::UnavailableOnPlatformError(InferenceFramework framework,
                                                       const std::string& reason)
    : InferenceError(display_name(framework) + " not available on this platform: " + reason),
      framework_(framework) {}

EngineInternalError::EngineInternalError(InferenceFramework framework, const std::string& reason)
    : InferenceError(display_name(framework) + " failed: " + reason),
      framework_(framework) {}

AllFrameworksExhaustedError::AllFrameworksExhaustedError(std::vector<FrameworkFailure> failures)
    : InferenceError(build_message(failures)),
      failures_(std::move(failures)) {}

std::string AllFrameworksExhaustedError::build_message(const std::vector<FrameworkFailure>& failures) {
    std::ostringstream oss;
    oss << "All inference frameworks failed to initialize";
    if (!failures.empty()) {
        oss << " (tried ";
        for (size_t i = 0; i < failures.size(); ++i) {
            oss << to_string(failures[i].framework);
            if (i < failures.size() - 1) oss << ", ";
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace sound_hazard
