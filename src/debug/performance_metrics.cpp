#include "flowdebug/debug/performance_metrics.hpp"
#include "flowdebug/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <fstream>
#include <unistd.h>

namespace flowdebug {

using json = nlohmann::json;

DECLARE_LOGGER("PerformanceMetrics");

namespace {

constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

template<typename Samples>
size_t first_exported(const Samples& samples, size_t limit) {
    return samples.size() > limit ? samples.size() - limit : 0;
}

}  // namespace

ProcessResourceSampler::ProcessResourceSampler() : last_wall_(SteadyClock::now()) {}

Result<ResourceUsage> ProcessResourceSampler::sample() {
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Cannot open /proc/self/statm"));
    }

    u64 size_pages = 0;
    u64 resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Malformed /proc/self/statm"));
    }

    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        page_size = 4096;
    }

    ResourceUsage usage;
    usage.vms_bytes = size_pages * static_cast<u64>(page_size);
    usage.rss_bytes = resident_pages * static_cast<u64>(page_size);

    // Process CPU time over wall time since the previous reading
    auto now = SteadyClock::now();
    double cpu_seconds = static_cast<double>(std::clock()) / CLOCKS_PER_SEC;
    if (has_previous_) {
        double wall_seconds = to_seconds(now - last_wall_);
        if (wall_seconds > 0.0) {
            usage.cpu_percent = (cpu_seconds - last_cpu_seconds_) / wall_seconds * 100.0;
        }
        if (usage.cpu_percent < 0.0) {
            usage.cpu_percent = 0.0;
        }
    }
    last_wall_ = now;
    last_cpu_seconds_ = cpu_seconds;
    has_previous_ = true;

    return usage;
}

PerformanceMetrics::PerformanceMetrics(std::unique_ptr<ResourceSampler> sampler)
    : sampler_(sampler ? std::move(sampler) : std::make_unique<ProcessResourceSampler>()) {}

void PerformanceMetrics::start_monitoring() {
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        start_time_ = SteadyClock::now();
        end_time_.reset();
        step_times_.clear();
        step_started_.clear();
        memory_usage_.clear();
        cpu_usage_.clear();
    }
    monitoring_ = true;
    collect_sample();
}

void PerformanceMetrics::stop_monitoring() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    end_time_ = SteadyClock::now();
    monitoring_ = false;
}

void PerformanceMetrics::start_step_timer(StepIndex index) {
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        step_times_[index] = StepTiming{SystemClock::now(), std::nullopt, Duration{0}};
        step_started_[index] = SteadyClock::now();
    }
    collect_sample();
}

void PerformanceMetrics::stop_step_timer(StepIndex index) {
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        auto it = step_times_.find(index);
        auto started = step_started_.find(index);
        if (it != step_times_.end() && started != step_started_.end()) {
            it->second.end = SystemClock::now();
            it->second.duration = std::chrono::duration_cast<Duration>(SteadyClock::now() - started->second);
        }
    }
    collect_sample();
}

void PerformanceMetrics::collect_sample() {
    if (!sampling_enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto usage = sampler_->sample();
    if (!usage) {
        COMPONENT_LOG_DEBUG("Resource sample skipped: {}", usage.error().message());
        return;
    }

    auto now = SystemClock::now();
    memory_usage_.push_back(MemorySample{now, usage.value().rss_bytes, usage.value().vms_bytes});
    cpu_usage_.push_back(CpuSample{now, usage.value().cpu_percent});
}

double PerformanceMetrics::get_total_execution_time() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    if (!start_time_) {
        return 0.0;
    }
    TimePoint end = end_time_ ? *end_time_ : SteadyClock::now();
    return to_seconds(end - *start_time_);
}

double PerformanceMetrics::get_step_execution_time(StepIndex index) const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = step_times_.find(index);
    if (it == step_times_.end()) {
        return 0.0;
    }
    return to_seconds(it->second.duration);
}

PerformanceMetrics::MemoryUsage PerformanceMetrics::get_average_memory_usage() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    MemoryUsage average;
    if (memory_usage_.empty()) {
        return average;
    }

    double rss_total = 0.0;
    double vms_total = 0.0;
    for (const auto& sample : memory_usage_) {
        rss_total += static_cast<double>(sample.rss);
        vms_total += static_cast<double>(sample.vms);
    }
    auto count = static_cast<double>(memory_usage_.size());
    average.rss = rss_total / count / kBytesPerMegabyte;
    average.vms = vms_total / count / kBytesPerMegabyte;
    return average;
}

double PerformanceMetrics::get_average_cpu_usage() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    if (cpu_usage_.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& sample : cpu_usage_) {
        total += sample.percent;
    }
    return total / static_cast<double>(cpu_usage_.size());
}

std::map<StepIndex, PerformanceMetrics::StepTiming> PerformanceMetrics::get_step_times() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return step_times_;
}

std::vector<PerformanceMetrics::MemorySample> PerformanceMetrics::get_memory_samples() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return memory_usage_;
}

std::vector<PerformanceMetrics::CpuSample> PerformanceMetrics::get_cpu_samples() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return cpu_usage_;
}

json PerformanceMetrics::to_dict() const {
    auto average_memory = get_average_memory_usage();

    json result;
    result["total_time"] = get_total_execution_time();
    result["avg_memory_usage"] = {{"rss", average_memory.rss}, {"vms", average_memory.vms}};
    result["avg_cpu_usage"] = get_average_cpu_usage();

    std::lock_guard<std::mutex> lock(metrics_mutex_);

    json steps = json::object();
    for (const auto& [index, timing] : step_times_) {
        steps[std::to_string(index)] = {
            {"start", to_epoch_seconds(timing.start)},
            {"end", timing.end ? to_epoch_seconds(*timing.end) : 0.0},
            {"duration", to_seconds(timing.duration)}
        };
    }
    result["step_times"] = std::move(steps);

    size_t limit = export_sample_limit_;

    json memory = json::array();
    for (size_t i = first_exported(memory_usage_, limit); i < memory_usage_.size(); ++i) {
        const auto& sample = memory_usage_[i];
        memory.push_back({{"timestamp", to_epoch_seconds(sample.timestamp)},
                          {"rss", sample.rss},
                          {"vms", sample.vms}});
    }
    result["memory_usage"] = std::move(memory);

    json cpu = json::array();
    for (size_t i = first_exported(cpu_usage_, limit); i < cpu_usage_.size(); ++i) {
        const auto& sample = cpu_usage_[i];
        cpu.push_back({{"timestamp", to_epoch_seconds(sample.timestamp)},
                       {"percent", sample.percent}});
    }
    result["cpu_usage"] = std::move(cpu);

    return result;
}

}  // namespace flowdebug
