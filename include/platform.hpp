#pragma once

#include <string>

namespace sound_hazard {

enum class PlatformKind {
    IOS,
    Android,
    Web,
    Desktop,
};

std::string to_string(PlatformKind kind);
PlatformKind platform_kind_from_string(const std::string& name);

// Static capabilities of the host, as far as inference backends care
struct PlatformInfo {
    PlatformKind kind = PlatformKind::Desktop;
    bool supports_gpu_delegate = false;
    bool supports_nnapi = false;
    bool supports_metal = false;
    bool supports_coreml = false;

    bool is_mobile() const { return kind == PlatformKind::Android || kind == PlatformKind::IOS; }

    // Capabilities a stock device of the given kind ships with
    static PlatformInfo for_kind(PlatformKind kind);
};

class PlatformProvider {
public:
    virtual ~PlatformProvider() = default;

    virtual PlatformInfo current() const = 0;
};

// Compile-time detection of the platform this binary was built for
class HostPlatformProvider : public PlatformProvider {
public:
    PlatformInfo current() const override;
};

// Fixed platform, used to simulate devices
class StaticPlatformProvider : public PlatformProvider {
public:
    explicit StaticPlatformProvider(PlatformInfo info) : info_(info) {}
    explicit StaticPlatformProvider(PlatformKind kind) : info_(PlatformInfo::for_kind(kind)) {}

    PlatformInfo current() const override { return info_; }

private:
    PlatformInfo info_;
};

} // namespace sound_hazard
