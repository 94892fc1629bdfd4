#include <gtest/gtest.h>
#include "flowdebug/debug/performance_metrics.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <thread>

namespace flowdebug::test {

using namespace std::chrono_literals;

namespace {

constexpr u64 kMegabyte = 1024 * 1024;

// Replays a fixed sequence of readings, repeating the last one
class ScriptedSampler : public ResourceSampler {
public:
    explicit ScriptedSampler(std::deque<ResourceUsage> readings) : readings_(std::move(readings)) {}

    Result<ResourceUsage> sample() override {
        if (fail_) {
            return unexpected(MAKE_ERROR(IO_READ_FAILED, "sampler offline"));
        }
        ResourceUsage usage = readings_.front();
        if (readings_.size() > 1) {
            readings_.pop_front();
        }
        return usage;
    }

    void set_failing(bool fail) { fail_ = fail; }

private:
    std::deque<ResourceUsage> readings_;
    bool fail_ = false;
};

}  // namespace

class PerformanceMetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto scripted = std::make_unique<ScriptedSampler>(std::deque<ResourceUsage>{
            {1 * kMegabyte, 10 * kMegabyte, 10.0},
            {3 * kMegabyte, 30 * kMegabyte, 30.0},
        });
        sampler = scripted.get();
        metrics = std::make_unique<PerformanceMetrics>(std::move(scripted));
    }

    ScriptedSampler* sampler = nullptr;
    std::unique_ptr<PerformanceMetrics> metrics;
};

TEST_F(PerformanceMetricsTest, NothingRecordedBeforeMonitoring) {
    EXPECT_FALSE(metrics->is_monitoring());
    EXPECT_DOUBLE_EQ(metrics->get_total_execution_time(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->get_step_execution_time(0), 0.0);
    EXPECT_DOUBLE_EQ(metrics->get_average_cpu_usage(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->get_average_memory_usage().rss, 0.0);
}

TEST_F(PerformanceMetricsTest, StepTimingIsRecorded) {
    metrics->start_monitoring();
    EXPECT_TRUE(metrics->is_monitoring());

    metrics->start_step_timer(0);
    std::this_thread::sleep_for(20ms);
    metrics->stop_step_timer(0);

    EXPECT_GE(metrics->get_step_execution_time(0), 0.015);
    auto steps = metrics->get_step_times();
    ASSERT_EQ(steps.count(0), 1u);
    EXPECT_TRUE(steps.at(0).end.has_value());

    metrics->stop_monitoring();
    EXPECT_FALSE(metrics->is_monitoring());
    double total = metrics->get_total_execution_time();
    EXPECT_GE(total, metrics->get_step_execution_time(0));

    // Frozen once stopped
    std::this_thread::sleep_for(5ms);
    EXPECT_DOUBLE_EQ(metrics->get_total_execution_time(), total);
}

TEST_F(PerformanceMetricsTest, UnfinishedStepReportsZero) {
    metrics->start_monitoring();
    metrics->start_step_timer(2);
    EXPECT_DOUBLE_EQ(metrics->get_step_execution_time(2), 0.0);
    EXPECT_FALSE(metrics->get_step_times().at(2).end.has_value());
}

TEST_F(PerformanceMetricsTest, SamplesAtEveryBoundary) {
    metrics->start_monitoring();
    metrics->start_step_timer(0);
    metrics->stop_step_timer(0);

    // start_monitoring, step start and step end
    EXPECT_EQ(metrics->get_memory_samples().size(), 3u);
    EXPECT_EQ(metrics->get_cpu_samples().size(), 3u);
}

TEST_F(PerformanceMetricsTest, AveragesInMegabytes) {
    metrics->start_monitoring();   // 1 MB / 10 MB / 10%
    metrics->start_step_timer(0);  // 3 MB / 30 MB / 30%

    auto memory = metrics->get_average_memory_usage();
    EXPECT_DOUBLE_EQ(memory.rss, 2.0);
    EXPECT_DOUBLE_EQ(memory.vms, 20.0);
    EXPECT_DOUBLE_EQ(metrics->get_average_cpu_usage(), 20.0);
}

TEST_F(PerformanceMetricsTest, StartMonitoringResets) {
    metrics->start_monitoring();
    metrics->start_step_timer(0);
    metrics->stop_step_timer(0);

    metrics->start_monitoring();
    EXPECT_TRUE(metrics->get_step_times().empty());
    EXPECT_EQ(metrics->get_memory_samples().size(), 1u);
}

TEST_F(PerformanceMetricsTest, SamplerFailuresAreSkipped) {
    sampler->set_failing(true);
    metrics->start_monitoring();
    metrics->start_step_timer(0);
    metrics->stop_step_timer(0);

    EXPECT_TRUE(metrics->get_memory_samples().empty());
    EXPECT_GE(metrics->get_step_execution_time(0), 0.0);
}

TEST_F(PerformanceMetricsTest, SamplingCanBeDisabled) {
    metrics->set_sampling_enabled(false);
    metrics->start_monitoring();
    metrics->start_step_timer(0);
    EXPECT_TRUE(metrics->get_cpu_samples().empty());
}

TEST_F(PerformanceMetricsTest, ExportLayout) {
    metrics->set_export_sample_limit(2);
    metrics->start_monitoring();
    for (StepIndex i = 0; i < 3; ++i) {
        metrics->start_step_timer(i);
        metrics->stop_step_timer(i);
    }
    metrics->stop_monitoring();

    auto dict = metrics->to_dict();
    EXPECT_TRUE(dict["total_time"].is_number());
    EXPECT_TRUE(dict["avg_cpu_usage"].is_number());
    EXPECT_TRUE(dict["avg_memory_usage"].contains("rss"));
    EXPECT_TRUE(dict["avg_memory_usage"].contains("vms"));

    ASSERT_TRUE(dict["step_times"].contains("1"));
    const auto& step = dict["step_times"]["1"];
    EXPECT_TRUE(step.contains("start"));
    EXPECT_TRUE(step.contains("end"));
    EXPECT_TRUE(step.contains("duration"));

    // Seven samples were taken; only the newest two are exported
    ASSERT_EQ(dict["memory_usage"].size(), 2u);
    EXPECT_EQ(dict["memory_usage"][0]["rss"].get<u64>(), 3 * kMegabyte);
    ASSERT_EQ(dict["cpu_usage"].size(), 2u);
    EXPECT_DOUBLE_EQ(dict["cpu_usage"][1]["percent"].get<double>(), 30.0);
    EXPECT_EQ(metrics->get_memory_samples().size(), 7u);
}

TEST(ProcessResourceSamplerTest, ReadsCurrentProcess) {
    ProcessResourceSampler sampler;
    auto first = sampler.sample();
    ASSERT_TRUE(first.has_value()) << first.error().to_string();
    EXPECT_GT(first.value().rss_bytes, 0u);
    EXPECT_GE(first.value().vms_bytes, first.value().rss_bytes);
    EXPECT_DOUBLE_EQ(first.value().cpu_percent, 0.0);

    auto second = sampler.sample();
    ASSERT_TRUE(second.has_value());
    EXPECT_GE(second.value().cpu_percent, 0.0);
}

}  // namespace flowdebug::test
