#include <gtest/gtest.h>
#include "benchmark_harness.hpp"
#include "fake_engine.hpp"
#include "memory_manager.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace sound_hazard {

using fakes::EngineJournal;
using fakes::FakeBehavior;
using fakes::make_fake_factory;

class BenchmarkHarnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_ = std::make_shared<EngineJournal>();

        samples_.resize(800);
        for (size_t i = 0; i < samples_.size(); ++i) {
            samples_[i] = 0.5 * std::sin(0.1 * static_cast<double>(i));
        }
    }

    std::shared_ptr<EngineJournal> journal_;
    std::vector<double> samples_;
};

TEST_F(BenchmarkHarnessTest, RejectsInvalidCounts) {
    auto factory = make_fake_factory(journal_);

    EXPECT_THROW(BenchmarkHarness(factory, -1, 10), std::invalid_argument);
    EXPECT_THROW(BenchmarkHarness(factory, 5, 0), std::invalid_argument);
    EXPECT_THROW(BenchmarkHarness(EngineFactory{}, 5, 10), std::invalid_argument);
    EXPECT_NO_THROW(BenchmarkHarness(factory, 0, 1));
}

TEST_F(BenchmarkHarnessTest, DefaultCounts) {
    BenchmarkHarness harness(make_fake_factory(journal_));

    EXPECT_EQ(harness.warmup_runs(), 5);
    EXPECT_EQ(harness.benchmark_runs(), 50);
}

TEST_F(BenchmarkHarnessTest, ResultsHoldTimingInvariants) {
    BenchmarkHarness harness(make_fake_factory(journal_), 2, 7);

    auto report = harness.run(samples_);

    ASSERT_EQ(report.results.size(), kAllFrameworks.size());
    for (const auto& [framework, result] : report.results) {
        EXPECT_EQ(result.framework(), framework);
        EXPECT_EQ(result.iterations(), 7);
        EXPECT_LE(result.min_inference_ms(), result.avg_inference_ms());
        EXPECT_LE(result.avg_inference_ms(), result.max_inference_ms());
        EXPECT_GE(result.min_inference_ms(), 0.0);
        EXPECT_GE(result.memory_usage_mb(), 0.0);
    }
    EXPECT_TRUE(report.skipped.empty());
}

TEST_F(BenchmarkHarnessTest, ResultsAreTimestampedDuringRun) {
    BenchmarkHarness harness(make_fake_factory(journal_), 0, 2);

    auto before = std::chrono::system_clock::now();
    auto report = harness.run(samples_, {InferenceFramework::OnnxRuntime});
    auto after = std::chrono::system_clock::now();

    ASSERT_EQ(report.results.count(InferenceFramework::OnnxRuntime), 1u);
    auto stamp = report.results.at(InferenceFramework::OnnxRuntime).timestamp();
    EXPECT_LE(before, stamp);
    EXPECT_LE(stamp, after);
}

TEST_F(BenchmarkHarnessTest, RunsWarmupAndTimedInferences) {
    BenchmarkHarness harness(make_fake_factory(journal_), 3, 4);

    harness.run(samples_, {InferenceFramework::OnnxRuntime});

    EXPECT_EQ(journal_->count("run:onnx_runtime"), 7);
    EXPECT_EQ(journal_->count("release:onnx_runtime"), 1);
}

TEST_F(BenchmarkHarnessTest, SkipsRecordReason) {
    FakeBehavior behavior;
    behavior.unavailable = {InferenceFramework::TfliteGpu, InferenceFramework::CoreMl};
    behavior.failing_load = {InferenceFramework::TfliteNnapi};
    behavior.failing_infer = {InferenceFramework::PytorchMobile};
    BenchmarkHarness harness(make_fake_factory(journal_, behavior), 1, 3);

    auto report = harness.run(samples_);

    // Keys are a subset of all identifiers
    EXPECT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results.count(InferenceFramework::TfliteCpu), 1u);
    EXPECT_EQ(report.results.count(InferenceFramework::TfliteMetal), 1u);
    EXPECT_EQ(report.results.count(InferenceFramework::OnnxRuntime), 1u);

    ASSERT_EQ(report.skipped.size(), 4u);
    auto reason_of = [&report](InferenceFramework framework) {
        auto it = std::find_if(report.skipped.begin(), report.skipped.end(),
                               [framework](const BenchmarkSkip& s) { return s.framework == framework; });
        EXPECT_NE(it, report.skipped.end());
        return it->reason;
    };
    EXPECT_EQ(reason_of(InferenceFramework::TfliteGpu), BenchmarkSkipReason::Unavailable);
    EXPECT_EQ(reason_of(InferenceFramework::CoreMl), BenchmarkSkipReason::Unavailable);
    EXPECT_EQ(reason_of(InferenceFramework::TfliteNnapi), BenchmarkSkipReason::InitializationFailed);
    EXPECT_EQ(reason_of(InferenceFramework::PytorchMobile), BenchmarkSkipReason::InferenceFailed);

    // The engine that failed mid-run is still disposed
    EXPECT_EQ(journal_->count("release:pytorch_mobile"), 1);
}

TEST_F(BenchmarkHarnessTest, EmptyReportWhenNothingRuns) {
    FakeBehavior behavior;
    behavior.unavailable.insert(kAllFrameworks.begin(), kAllFrameworks.end());
    BenchmarkHarness harness(make_fake_factory(journal_, behavior), 0, 1);

    auto report = harness.run(samples_);

    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.skipped.size(), kAllFrameworks.size());
    EXPECT_FALSE(report.fastest().has_value());
    EXPECT_EQ(report.to_markdown().find("## Winner"), std::string::npos);
}

TEST_F(BenchmarkHarnessTest, ScratchMemoryReleasedAfterRun) {
    BenchmarkHarness harness(make_fake_factory(journal_), 1, 5);

    harness.run(samples_, {InferenceFramework::TfliteCpu});

    EXPECT_EQ(MemoryManager::instance().get_usage("scratch/tflite_cpu"), 0u);
}

TEST(BenchmarkResultTest, ToStringFormat) {
    BenchmarkResult result(InferenceFramework::TfliteCpu, 25.5, 20.0, 31.256, 1.5, 50);

    EXPECT_EQ(result.to_string(), "Framework: tflite_cpu\nAvg: 25.50ms\nMin: 20.00ms\nMax: 31.26ms\n");
}

TEST(BenchmarkResultTest, ToJsonHasEveryField) {
    BenchmarkResult result(InferenceFramework::OnnxRuntime, 10.0, 8.0, 12.0, 0.25, 50);

    auto j = result.to_json();

    EXPECT_EQ(j["framework"], "onnx_runtime");
    EXPECT_DOUBLE_EQ(j["avg_inference_ms"].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(j["min_inference_ms"].get<double>(), 8.0);
    EXPECT_DOUBLE_EQ(j["max_inference_ms"].get<double>(), 12.0);
    EXPECT_DOUBLE_EQ(j["memory_usage_mb"].get<double>(), 0.25);
    EXPECT_EQ(j["iterations"], 50);
    EXPECT_TRUE(j["timestamp"].is_string());
}

TEST(BenchmarkReportTest, FastestAndMarkdownOrdering) {
    BenchmarkReport report;
    report.results.emplace(InferenceFramework::OnnxRuntime,
                           BenchmarkResult(InferenceFramework::OnnxRuntime, 12.0, 10.0, 15.0, 0.0, 50));
    report.results.emplace(InferenceFramework::TfliteCpu,
                           BenchmarkResult(InferenceFramework::TfliteCpu, 8.0, 7.0, 9.0, 0.0, 50));
    report.skipped.push_back({InferenceFramework::CoreMl, BenchmarkSkipReason::Unavailable, "not on desktop"});

    ASSERT_TRUE(report.fastest().has_value());
    EXPECT_EQ(report.fastest()->framework(), InferenceFramework::TfliteCpu);

    auto md = report.to_markdown();
    EXPECT_EQ(md.rfind("# Inference Engine Benchmark Report", 0), 0u);
    auto first = md.find("### 1. TensorFlow Lite");
    auto second = md.find("### 2. ONNX Runtime");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(md.find("- **Average Inference Time**: 8.00 ms"), std::string::npos);
    EXPECT_NE(md.find("## Winner: TensorFlow Lite"), std::string::npos);
    EXPECT_NE(md.find("Core ML** (unavailable): not on desktop"), std::string::npos);

    auto j = report.to_json();
    EXPECT_EQ(j["fastest"], "tflite_cpu");
    EXPECT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["skipped"][0]["reason"], "unavailable");
}

TEST(BenchmarkReportTest, MarkdownStampedWithLatestResult) {
    // 2024-01-02 03:04:05 UTC and 45 seconds earlier
    auto latest = std::chrono::system_clock::from_time_t(1704164645);
    auto earlier = std::chrono::system_clock::from_time_t(1704164600);

    BenchmarkReport report;
    report.results.emplace(InferenceFramework::OnnxRuntime,
                           BenchmarkResult(InferenceFramework::OnnxRuntime, 12.0, 10.0, 15.0, 0.0, 50, latest));
    report.results.emplace(InferenceFramework::TfliteCpu,
                           BenchmarkResult(InferenceFramework::TfliteCpu, 8.0, 7.0, 9.0, 0.0, 50, earlier));

    EXPECT_NE(report.to_markdown().find("Generated: 2024-01-02 03:04:05 UTC"), std::string::npos);
    EXPECT_EQ(report.results.at(InferenceFramework::TfliteCpu).to_json()["timestamp"], "2024-01-02T03:03:20Z");
}

} // namespace sound_hazard
