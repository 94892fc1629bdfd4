#pragma once

#include "flowdebug/utils/types.hpp"
#include "flowdebug/utils/error.hpp"
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace flowdebug {

// Point-in-time resource usage of the current process
struct ResourceUsage {
    u64 rss_bytes = 0;
    u64 vms_bytes = 0;
    double cpu_percent = 0.0;
};

/**
 * @brief Source of resource usage readings
 *
 * The collector calls sample() on the worker thread at every step
 * boundary; an implementation only needs to be safe for that one caller.
 */
class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;
    virtual Result<ResourceUsage> sample() = 0;
};

// Reads /proc/self/statm and the process CPU clock
class ProcessResourceSampler : public ResourceSampler {
public:
    ProcessResourceSampler();
    Result<ResourceUsage> sample() override;

private:
    TimePoint last_wall_;
    double last_cpu_seconds_ = 0.0;
    bool has_previous_ = false;
};

class PerformanceMetrics {
public:
    struct StepTiming {
        WallTime start;
        std::optional<WallTime> end;
        Duration duration{0};
    };

    struct MemorySample {
        WallTime timestamp;
        u64 rss = 0;
        u64 vms = 0;
    };

    struct CpuSample {
        WallTime timestamp;
        double percent = 0.0;
    };

    // Averages in megabytes
    struct MemoryUsage {
        double rss = 0.0;
        double vms = 0.0;
    };

    static constexpr size_t kDefaultExportSampleLimit = 100;

    explicit PerformanceMetrics(std::unique_ptr<ResourceSampler> sampler = nullptr);

    void start_monitoring();
    void stop_monitoring();
    bool is_monitoring() const { return monitoring_; }

    void start_step_timer(StepIndex index);
    void stop_step_timer(StepIndex index);

    // Seconds since start_monitoring, or until stop_monitoring once stopped
    double get_total_execution_time() const;

    // Seconds; 0 for a step that never finished
    double get_step_execution_time(StepIndex index) const;

    MemoryUsage get_average_memory_usage() const;
    double get_average_cpu_usage() const;

    std::map<StepIndex, StepTiming> get_step_times() const;
    std::vector<MemorySample> get_memory_samples() const;
    std::vector<CpuSample> get_cpu_samples() const;

    void set_sampling_enabled(bool enabled) { sampling_enabled_ = enabled; }
    void set_export_sample_limit(size_t limit) { export_sample_limit_ = limit; }

    /**
     * @brief Export as {total_time, step_times, avg_memory_usage:{rss,vms},
     * avg_cpu_usage, memory_usage[], cpu_usage[]}
     *
     * Only the most recent export_sample_limit raw samples of each kind
     * are included.
     */
    nlohmann::json to_dict() const;

private:
    void collect_sample();

    std::unique_ptr<ResourceSampler> sampler_;

    mutable std::mutex metrics_mutex_;
    std::optional<TimePoint> start_time_;
    std::optional<TimePoint> end_time_;
    std::map<StepIndex, StepTiming> step_times_;
    std::map<StepIndex, TimePoint> step_started_;
    std::vector<MemorySample> memory_usage_;
    std::vector<CpuSample> cpu_usage_;

    std::atomic<bool> monitoring_{false};
    std::atomic<bool> sampling_enabled_{true};
    std::atomic<size_t> export_sample_limit_{kDefaultExportSampleLimit};
};

}  // namespace flowdebug
