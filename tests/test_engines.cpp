#include <gtest/gtest.h>
#include "inference_errors.hpp"
#include "memory_manager.hpp"
#include "onnx_engine.hpp"
#include "tflite_engine.hpp"
#include "torch_engine.hpp"
#include <cmath>
#include <numeric>
#include <string>

namespace sound_hazard {

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        desktop_ = PlatformInfo::for_kind(PlatformKind::Desktop);
        android_ = PlatformInfo::for_kind(PlatformKind::Android);

        // 200 Hz tone at 16 kHz, well above the loud threshold
        loud_tone_.resize(config_.window_size);
        for (size_t i = 0; i < loud_tone_.size(); ++i) {
            loud_tone_[i] = 0.9 * std::sin(2.0 * 3.14159265358979323846 * 200.0 * i / config_.sample_rate);
        }

        quiet_.assign(4000, 0.0);
        for (size_t i = 0; i < quiet_.size(); ++i) {
            quiet_[i] = (i % 2 == 0) ? 0.0005 : -0.0005;
        }
    }

    InferenceConfig config_;
    PlatformInfo desktop_;
    PlatformInfo android_;
    std::vector<double> loud_tone_;
    std::vector<double> quiet_;
};

TEST_F(EngineTest, InferBeforeInitializeThrows) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);

    EXPECT_FALSE(engine.is_initialized());
    EXPECT_THROW(engine.infer(loud_tone_), NotInitializedError);
}

TEST_F(EngineTest, OnnxPlaceholderInference) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    ASSERT_TRUE(engine.is_available());

    engine.initialize();
    ASSERT_TRUE(engine.is_initialized());
    EXPECT_TRUE(engine.is_placeholder());

    auto result = engine.infer(loud_tone_);

    EXPECT_EQ(result["framework"], "onnx_runtime");
    EXPECT_EQ(result["mode"], "placeholder");
    EXPECT_EQ(result["label"], "Siren");
    EXPECT_EQ(result["num_samples"], loud_tone_.size());
    EXPECT_GT(result["db_level"].get<double>(), 70.0);

    auto scores = result["scores"].get<std::vector<double>>();
    ASSERT_EQ(scores.size(), config_.labels.size());
    EXPECT_NEAR(std::accumulate(scores.begin(), scores.end(), 0.0), 1.0, 1e-4);

    double confidence = result["confidence"].get<double>();
    EXPECT_GE(confidence, 0.0);
    EXPECT_LE(confidence, 1.0);
}

TEST_F(EngineTest, QuietInputIsSilence) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();

    auto result = engine.infer(quiet_);

    EXPECT_EQ(result["label"], "Silence");
    EXPECT_LT(result["db_level"].get<double>(), 30.0);
}

TEST_F(EngineTest, PlaceholderWithForeignLabelsReportsUnknown) {
    config_.labels = {"Quiet", "Loud"};
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();

    auto result = engine.infer(loud_tone_);

    EXPECT_EQ(result["mode"], "placeholder");
    EXPECT_EQ(result["class_index"], -1);
    EXPECT_EQ(result["label"], "Unknown");
    EXPECT_TRUE(result["scores"].empty());
}

TEST_F(EngineTest, EmptyInputReturnsDegenerateResult) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();

    InferenceResult result;
    ASSERT_NO_THROW(result = engine.infer({}));

    EXPECT_EQ(result["mode"], "empty_input");
    EXPECT_EQ(result["label"], "Silence");
    EXPECT_DOUBLE_EQ(result["confidence"].get<double>(), 1.0);
    EXPECT_TRUE(result["scores"].empty());
    EXPECT_EQ(result["num_samples"], 0);
}

TEST_F(EngineTest, TfliteCpuEmptyInput) {
    if (!TFLiteEngine::is_compiled()) {
        GTEST_SKIP() << "built without TensorFlow Lite";
    }

    TFLiteEngine engine(InferenceFramework::TfliteCpu, config_, desktop_);
    engine.initialize();

    auto result = engine.infer({});

    EXPECT_EQ(result["framework"], "tflite_cpu");
    EXPECT_EQ(result["mode"], "empty_input");
}

TEST_F(EngineTest, ScratchMemoryReturnsToZero) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();
    auto& manager = MemoryManager::instance();

    for (int i = 0; i < 3; ++i) {
        engine.infer(loud_tone_);
        EXPECT_EQ(manager.get_usage("scratch/onnx_runtime"), 0u);
    }
}

TEST_F(EngineTest, DisposeIsIdempotent) {
    OnnxRuntimeEngine never_initialized(InferenceFramework::OnnxRuntime, config_, desktop_);
    EXPECT_NO_THROW(never_initialized.dispose());

    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();
    engine.dispose();
    EXPECT_NO_THROW(engine.dispose());
    EXPECT_FALSE(engine.is_initialized());
    EXPECT_THROW(engine.infer(loud_tone_), NotInitializedError);
}

TEST_F(EngineTest, DisposeWritesNothingWhenVerbose) {
    config_.verbose = true;
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();

    ::testing::internal::CaptureStdout();
    engine.dispose();
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(output.empty()) << output;
    EXPECT_FALSE(engine.is_initialized());
}

TEST_F(EngineTest, InitializeTwiceIsNoOp) {
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);
    engine.initialize();
    EXPECT_NO_THROW(engine.initialize());
    EXPECT_TRUE(engine.is_initialized());
}

TEST_F(EngineTest, UnavailableEnginesRefuseToInitialize) {
    TFLiteEngine gpu(InferenceFramework::TfliteGpu, config_, desktop_);
    OnnxRuntimeEngine coreml(InferenceFramework::CoreMl, config_, desktop_);
    PyTorchMobileEngine torch_engine(config_, desktop_);

    EXPECT_FALSE(gpu.is_available());
    EXPECT_FALSE(coreml.is_available());
    EXPECT_FALSE(torch_engine.is_available());

    EXPECT_THROW(gpu.initialize(), UnavailableOnPlatformError);
    EXPECT_THROW(coreml.initialize(), UnavailableOnPlatformError);
    EXPECT_THROW(torch_engine.initialize(), UnavailableOnPlatformError);
    EXPECT_FALSE(gpu.is_initialized());
}

TEST_F(EngineTest, UnavailableErrorNamesFramework) {
    OnnxRuntimeEngine coreml(InferenceFramework::CoreMl, config_, desktop_);

    try {
        coreml.initialize();
        FAIL() << "Expected UnavailableOnPlatformError";
    } catch (const UnavailableOnPlatformError& e) {
        EXPECT_EQ(e.framework(), InferenceFramework::CoreMl);
    }
}

TEST_F(EngineTest, PyTorchMobileAvailableOnMobile) {
    PyTorchMobileEngine engine(config_, android_);
    ASSERT_TRUE(engine.is_available());

    engine.initialize();
    auto result = engine.infer(loud_tone_);

    EXPECT_EQ(result["framework"], "pytorch_mobile");
    EXPECT_EQ(result["mode"], "placeholder");
}

TEST_F(EngineTest, MissingModelWithoutPlaceholderFails) {
    config_.placeholder_when_model_missing = false;
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);

    EXPECT_THROW(engine.initialize(), EngineInternalError);
    EXPECT_FALSE(engine.is_initialized());
}

TEST_F(EngineTest, UnreadableModelFailsCleanly) {
    config_.onnx_model_path = "/nonexistent/sound_classifier.onnx";
    OnnxRuntimeEngine engine(InferenceFramework::OnnxRuntime, config_, desktop_);

    try {
        engine.initialize();
        FAIL() << "Expected EngineInternalError";
    } catch (const EngineInternalError& e) {
        EXPECT_EQ(e.framework(), InferenceFramework::OnnxRuntime);
    }
    EXPECT_FALSE(engine.is_initialized());
    EXPECT_NO_THROW(engine.dispose());
}

TEST_F(EngineTest, WrongFrameworkRejectedAtConstruction) {
    EXPECT_THROW(TFLiteEngine(InferenceFramework::OnnxRuntime, config_, desktop_), std::invalid_argument);
    EXPECT_THROW(OnnxRuntimeEngine(InferenceFramework::TfliteCpu, config_, desktop_), std::invalid_argument);
}

TEST_F(EngineTest, TfliteDelegateAvailabilityFollowsBuild) {
    EXPECT_EQ(TFLiteEngine(InferenceFramework::TfliteCpu, config_, desktop_).is_available(),
              TFLiteEngine::is_compiled());
    EXPECT_FALSE(TFLiteEngine(InferenceFramework::TfliteNnapi, config_, desktop_).is_available());
    EXPECT_FALSE(TFLiteEngine(InferenceFramework::TfliteMetal, config_, desktop_).is_available());
}

} // namespace sound_hazard
