#include <gtest/gtest.h>
#include "engine_factory.hpp"
#include "tflite_engine.hpp"
#include <algorithm>

namespace sound_hazard {

class EngineFactoryTest : public ::testing::Test {
protected:
    bool contains(const std::vector<InferenceFramework>& frameworks, InferenceFramework framework) {
        return std::find(frameworks.begin(), frameworks.end(), framework) != frameworks.end();
    }

    InferenceConfig config_;
};

TEST_F(EngineFactoryTest, CreatesEngineForEveryFramework) {
    auto platform = PlatformInfo::for_kind(PlatformKind::Desktop);

    for (auto framework : kAllFrameworks) {
        auto engine = create_engine(framework, config_, platform);
        ASSERT_NE(engine, nullptr) << to_string(framework);
        EXPECT_EQ(engine->framework(), framework);
        EXPECT_FALSE(engine->is_initialized());
    }
}

TEST_F(EngineFactoryTest, OnnxRuntimeAlwaysAvailable) {
    for (auto kind : {PlatformKind::IOS, PlatformKind::Android, PlatformKind::Web, PlatformKind::Desktop}) {
        auto available = available_frameworks(config_, PlatformInfo::for_kind(kind));
        EXPECT_TRUE(contains(available, InferenceFramework::OnnxRuntime)) << to_string(kind);
    }
}

TEST_F(EngineFactoryTest, DesktopAvailability) {
    auto available = available_frameworks(config_, PlatformInfo::for_kind(PlatformKind::Desktop));

    EXPECT_FALSE(contains(available, InferenceFramework::TfliteGpu));
    EXPECT_FALSE(contains(available, InferenceFramework::TfliteNnapi));
    EXPECT_FALSE(contains(available, InferenceFramework::CoreMl));
    EXPECT_FALSE(contains(available, InferenceFramework::PytorchMobile));
    EXPECT_EQ(contains(available, InferenceFramework::TfliteCpu), TFLiteEngine::is_compiled());
}

TEST_F(EngineFactoryTest, PyTorchMobileNeedsMobilePlatform) {
    auto android = PlatformInfo::for_kind(PlatformKind::Android);
    auto web = PlatformInfo::for_kind(PlatformKind::Web);

    EXPECT_TRUE(is_framework_available(InferenceFramework::PytorchMobile, config_, android));
    EXPECT_FALSE(is_framework_available(InferenceFramework::PytorchMobile, config_, web));
}

TEST_F(EngineFactoryTest, FactoryQueriesPlatformProvider) {
    auto factory = make_engine_factory(config_, std::make_shared<StaticPlatformProvider>(PlatformKind::IOS));

    auto engine = factory(InferenceFramework::PytorchMobile);
    ASSERT_NE(engine, nullptr);
    EXPECT_TRUE(engine->is_available());
}

TEST_F(EngineFactoryTest, FactoryRequiresPlatformProvider) {
    EXPECT_THROW(make_engine_factory(config_, nullptr), std::invalid_argument);
}

} // namespace sound_hazard
