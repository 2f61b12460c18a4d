#include "platform.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

#ifdef __APPLE__
#include <TargetConditionals.h>
#endif

namespace sound_hazard {

std::string to_string(PlatformKind kind) {
    switch (kind) {
        case PlatformKind::IOS: return "ios";
        case PlatformKind::Android: return "android";
        case PlatformKind::Web: return "web";
        case PlatformKind::Desktop: return "desktop";
    }
    throw std::invalid_argument("Unknown platform kind value");
}

PlatformKind platform_kind_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "ios") return PlatformKind::IOS;
    if (lowered == "android") return PlatformKind::Android;
    if (lowered == "web") return PlatformKind::Web;
    if (lowered == "desktop") return PlatformKind::Desktop;
    throw std::invalid_argument("Unknown platform: " + name);
}

PlatformInfo PlatformInfo::for_kind(PlatformKind kind) {
    PlatformInfo info;
    info.kind = kind;
    switch (kind) {
        case PlatformKind::Android:
            info.supports_gpu_delegate = true;
            info.supports_nnapi = true;
            break;
        case PlatformKind::IOS:
            info.supports_metal = true;
            info.supports_coreml = true;
            break;
        case PlatformKind::Web:
        case PlatformKind::Desktop:
            break;
    }
    return info;
}

PlatformInfo HostPlatformProvider::current() const {
#if defined(__ANDROID__)
    return PlatformInfo::for_kind(PlatformKind::Android);
#elif defined(__APPLE__) && TARGET_OS_IPHONE
    return PlatformInfo::for_kind(PlatformKind::IOS);
#elif defined(__EMSCRIPTEN__)
    return PlatformInfo::for_kind(PlatformKind::Web);
#else
    return PlatformInfo::for_kind(PlatformKind::Desktop);
#endif
}

} // namespace sound_hazard
