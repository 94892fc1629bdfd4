#pragma once

#include "flowdebug/core/variable_store.hpp"
#include "flowdebug/debug/breakpoint_registry.hpp"
#include "flowdebug/debug/condition_evaluator.hpp"
#include "flowdebug/debug/debug_log.hpp"
#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/debug/pause_signal.hpp"
#include "flowdebug/debug/performance_metrics.hpp"
#include "flowdebug/utils/error.hpp"
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace flowdebug {

/**
 * @brief Debugger for a step-based flow running on a worker thread
 *
 * The flow executor calls on_step_start / on_step_complete around every
 * step and on_flow_complete once at the end. Depending on the execution
 * mode and the configured breakpoints, those calls block the worker in
 * wait_for_continue() until the controlling thread calls
 * resume_execution() or stop_debugging().
 *
 * Observers are single-slot: setting a handler replaces the previous one.
 * Handlers run on the thread that triggered the event, without any
 * internal lock held, so they may call back into the controller.
 */
class ExecutionController {
public:
    struct Options {
        size_t max_log_entries = DebugLogBuffer::kDefaultMaxEntries;
        std::chrono::milliseconds pause_timeout{0};  // 0 waits forever
        bool mirror_to_logger = true;
        bool sample_resources = true;
        size_t export_sample_limit = PerformanceMetrics::kDefaultExportSampleLimit;
    };

    using BreakpointHitHandler =
        std::function<void(const std::string& breakpoint_id, StepIndex step_index, const StepRecord& step)>;
    using StepExecutionHandler = std::function<void(StepIndex step_index, const StepRecord& step)>;
    using VariableChangedHandler = std::function<void(const std::string& name, const Value& value)>;
    using ExecutionPausedHandler = std::function<void(StepIndex step_index)>;
    using ExecutionResumedHandler = std::function<void(StepIndex step_index)>;

    explicit ExecutionController(const VariableStore* store = nullptr);
    ExecutionController(const VariableStore* store, const Options& options,
                        std::unique_ptr<ResourceSampler> sampler = nullptr);
    ~ExecutionController();

    ExecutionController(const ExecutionController&) = delete;
    ExecutionController& operator=(const ExecutionController&) = delete;

    // The store is not owned and must outlive the session
    void set_variable_store(const VariableStore* store);

    void set_execution_mode(ExecutionMode mode);
    ExecutionMode get_execution_mode() const { return mode_; }

    // Breakpoint management
    std::string add_breakpoint(Breakpoint breakpoint);
    bool remove_breakpoint(const std::string& id);
    std::optional<Breakpoint> get_breakpoint(const std::string& id) const;
    std::vector<Breakpoint> get_all_breakpoints() const;
    void clear_breakpoints();
    bool enable_breakpoint(const std::string& id, bool enabled);
    std::pair<bool, std::string> toggle_breakpoint(StepIndex step_index);
    Result<std::string> save_breakpoints(const std::string& path) const;
    Result<size_t> load_breakpoints(const std::string& path);

    BreakpointRegistry& breakpoints() { return registry_; }
    const BreakpointRegistry& breakpoints() const { return registry_; }

    // Watch variables
    bool add_watch_variable(const std::string& name);
    bool remove_watch_variable(const std::string& name);
    std::vector<std::string> get_watch_variables() const;
    void clear_watch_variables();

    // Current values of watched variables; None for names the store does not know
    std::map<std::string, Value> get_watch_variable_values() const;

    // Execution control
    void start_debugging(ExecutionMode mode = ExecutionMode::DEBUG);
    void pause_execution();
    void resume_execution();
    void stop_debugging();

    bool is_paused() const { return paused_; }
    bool is_debugging() const { return debugging_; }
    StepIndex current_step_index() const { return current_step_; }

    // The only place the worker thread blocks
    void wait_for_continue();

    // Flow executor callbacks
    void on_step_start(StepIndex step_index, const StepRecord& step);
    void on_step_complete(StepIndex step_index, bool success, const std::string& message);
    // Structured messages contribute their "message" member, or their JSON text
    void on_step_complete(StepIndex step_index, bool success, const nlohmann::json& message);
    void on_step_complete(StepIndex step_index, bool success, const char* message) {
        on_step_complete(step_index, success, std::string(message));
    }
    void on_flow_complete(bool success);

    // Observers
    void set_breakpoint_hit_handler(BreakpointHitHandler handler);
    void set_step_execution_handler(StepExecutionHandler handler);
    void set_variable_changed_handler(VariableChangedHandler handler);
    void set_execution_paused_handler(ExecutionPausedHandler handler);
    void set_execution_resumed_handler(ExecutionResumedHandler handler);

    // Performance metrics
    nlohmann::json get_performance_metrics() const;
    PerformanceMetrics& metrics() { return *metrics_; }
    const PerformanceMetrics& metrics() const { return *metrics_; }

    // Debug log
    std::vector<DebugLogEntry> get_debug_logs(std::optional<DebugLogLevel> filter_level = std::nullopt) const;
    void clear_debug_logs();
    Result<std::string> export_debug_logs(const std::string& path) const;
    Result<std::string> export_debug_logs_json(const std::string& path) const;

private:
    struct BreakpointMatch {
        std::string breakpoint_id;
        StepIndex step_index;
        StepRecord context;
    };

    std::vector<BreakpointMatch> match_start_breakpoints(StepIndex step_index, const StepRecord& step);
    std::vector<BreakpointMatch> match_error_breakpoints(StepIndex step_index, const std::string& message);
    std::vector<BreakpointMatch> match_variable_breakpoints();

    // Records every match, then pauses once for the first one
    void handle_matches(const std::vector<BreakpointMatch>& matches, u64 session);

    // Worker-side pause; false when the session was stopped after `session` was read
    bool pause_session(u64 session);

    void report_watch_variables();
    void log(DebugLogLevel level, const std::string& message);

    template<typename Handler, typename... Args>
    void notify(const Handler& handler, const char* event, Args&&... args);

    const VariableStore* store() const;
    std::string current_action_id() const;

    Options options_;

    mutable std::mutex store_mutex_;
    const VariableStore* store_ = nullptr;

    BreakpointRegistry registry_;
    ConditionEvaluator evaluator_;
    std::unique_ptr<PerformanceMetrics> metrics_;
    DebugLogBuffer log_;
    PauseSignal continue_signal_;

    std::atomic<ExecutionMode> mode_{ExecutionMode::NORMAL};
    std::atomic<bool> paused_{false};
    std::atomic<bool> debugging_{false};
    std::atomic<StepIndex> current_step_{kNoStep};

    mutable std::mutex state_mutex_;
    std::string current_action_id_;

    mutable std::mutex watch_mutex_;
    std::set<std::string> watch_variables_;

    mutable std::mutex handlers_mutex_;
    BreakpointHitHandler breakpoint_hit_handler_;
    StepExecutionHandler step_execution_handler_;
    VariableChangedHandler variable_changed_handler_;
    ExecutionPausedHandler execution_paused_handler_;
    ExecutionResumedHandler execution_resumed_handler_;
};

}  // namespace flowdebug
