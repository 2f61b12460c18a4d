#pragma once

#include "inference_config.hpp"
#include "inference_engine.hpp"
#include "inference_framework.hpp"
#include "platform.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace sound_hazard {

// Creates a fresh, uninitialized engine for a framework
using EngineFactory = std::function<std::unique_ptr<InferenceEngine>(InferenceFramework)>;

// Built-in engine for every framework identifier
std::unique_ptr<InferenceEngine> create_engine(InferenceFramework framework,
                                               const InferenceConfig& config,
                                               const PlatformInfo& platform);

// Factory bound to a config, querying the platform at creation time
EngineFactory make_engine_factory(const InferenceConfig& config,
                                  std::shared_ptr<const PlatformProvider> platform);

// Backend discovery
std::vector<InferenceFramework> available_frameworks(const InferenceConfig& config,
                                                     const PlatformInfo& platform);
bool is_framework_available(InferenceFramework framework,
                            const InferenceConfig& config,
                            const PlatformInfo& platform);

} // namespace sound_hazard
