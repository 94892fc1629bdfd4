#include "flowdebug/debug/execution_controller.hpp"
#include "flowdebug/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace flowdebug {

DECLARE_LOGGER("ExecutionController");

ExecutionController::ExecutionController(const VariableStore* store)
    : ExecutionController(store, Options{}) {}

ExecutionController::ExecutionController(const VariableStore* store, const Options& options,
                                         std::unique_ptr<ResourceSampler> sampler)
    : options_(options),
      store_(store),
      metrics_(std::make_unique<PerformanceMetrics>(std::move(sampler))),
      log_(options.max_log_entries, options.mirror_to_logger),
      continue_signal_(true) {
    metrics_->set_sampling_enabled(options_.sample_resources);
    metrics_->set_export_sample_limit(options_.export_sample_limit);
}

ExecutionController::~ExecutionController() {
    // A worker still parked in wait_for_continue must not outlive the signal
    continue_signal_.release();
}

template<typename Handler, typename... Args>
void ExecutionController::notify(const Handler& handler, const char* event, Args&&... args) {
    Handler callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = handler;
    }
    if (!callback) {
        return;
    }

    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        COMPONENT_LOG_ERROR("{} handler threw: {}", event, e.what());
        log_.add(DebugLogLevel::ERROR, fmt::format("{} handler failed: {}", event, e.what()));
    }
}

void ExecutionController::set_variable_store(const VariableStore* store) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_ = store;
}

const VariableStore* ExecutionController::store() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return store_;
}

std::string ExecutionController::current_action_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_action_id_;
}

void ExecutionController::set_execution_mode(ExecutionMode mode) {
    mode_ = mode;
    COMPONENT_LOG_DEBUG("Execution mode set to {}", to_string(mode));
}

// Breakpoint management

std::string ExecutionController::add_breakpoint(Breakpoint breakpoint) {
    if (breakpoint.type == BreakpointType::CONDITION) {
        auto valid = ConditionEvaluator::validate(breakpoint.condition);
        if (!valid) {
            // Kept anyway: evaluation fails closed and logs each time
            log(DebugLogLevel::WARNING, "Condition '" + breakpoint.condition +
                "' will never match: " + valid.error().message());
        }
    }
    return registry_.add(std::move(breakpoint));
}

bool ExecutionController::remove_breakpoint(const std::string& id) {
    return registry_.remove(id);
}

std::optional<Breakpoint> ExecutionController::get_breakpoint(const std::string& id) const {
    return registry_.get(id);
}

std::vector<Breakpoint> ExecutionController::get_all_breakpoints() const {
    return registry_.list();
}

void ExecutionController::clear_breakpoints() {
    registry_.clear();
}

bool ExecutionController::enable_breakpoint(const std::string& id, bool enabled) {
    return registry_.set_enabled(id, enabled);
}

std::pair<bool, std::string> ExecutionController::toggle_breakpoint(StepIndex step_index) {
    return registry_.toggle(step_index);
}

Result<std::string> ExecutionController::save_breakpoints(const std::string& path) const {
    return registry_.save(path);
}

Result<size_t> ExecutionController::load_breakpoints(const std::string& path) {
    auto loaded = registry_.load(path);
    if (!loaded) {
        log(DebugLogLevel::ERROR, "Failed to load breakpoints: " + loaded.error().message());
        return loaded;
    }
    log(DebugLogLevel::INFO, fmt::format("Loaded {} breakpoints from {}", loaded.value(), path));
    return loaded;
}

// Watch variables

bool ExecutionController::add_watch_variable(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watch_variables_.insert(name).second;
}

bool ExecutionController::remove_watch_variable(const std::string& name) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watch_variables_.erase(name) > 0;
}

std::vector<std::string> ExecutionController::get_watch_variables() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return std::vector<std::string>(watch_variables_.begin(), watch_variables_.end());
}

void ExecutionController::clear_watch_variables() {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watch_variables_.clear();
}

std::map<std::string, Value> ExecutionController::get_watch_variable_values() const {
    std::map<std::string, Value> values;
    const VariableStore* variables = store();
    if (!variables) {
        return values;
    }
    for (const auto& name : get_watch_variables()) {
        values[name] = variables->get_variable(name).value_or(Value());
    }
    return values;
}

// Execution control

void ExecutionController::start_debugging(ExecutionMode mode) {
    mode_ = mode;
    paused_ = false;
    continue_signal_.release();
    current_step_ = kNoStep;
    debugging_ = true;
    metrics_->start_monitoring();
    log(DebugLogLevel::INFO, fmt::format("Debugging started in {} mode", to_string(mode)));
}

void ExecutionController::pause_execution() {
    paused_ = true;
    continue_signal_.clear();
    log(DebugLogLevel::DEBUG, "Execution paused");
    notify(execution_paused_handler_, "execution-paused", current_step_.load());
}

bool ExecutionController::pause_session(u64 session) {
    paused_ = true;
    if (!continue_signal_.clear_if(session)) {
        paused_ = false;
        log(DebugLogLevel::DEBUG, "Session ended before the pause took effect");
        return false;
    }
    log(DebugLogLevel::DEBUG, "Execution paused");
    notify(execution_paused_handler_, "execution-paused", current_step_.load());
    return true;
}

void ExecutionController::resume_execution() {
    paused_ = false;
    continue_signal_.set();
    log(DebugLogLevel::DEBUG, "Execution resumed");
    notify(execution_resumed_handler_, "execution-resumed", current_step_.load());
}

void ExecutionController::stop_debugging() {
    mode_ = ExecutionMode::NORMAL;
    paused_ = false;
    continue_signal_.release();

    bool was_debugging = debugging_.exchange(false);
    if (metrics_->is_monitoring()) {
        metrics_->stop_monitoring();
    }
    if (was_debugging) {
        log(DebugLogLevel::DEBUG, "Debugging stopped");
    }
}

void ExecutionController::wait_for_continue() {
    if (options_.pause_timeout.count() <= 0) {
        continue_signal_.wait();
        return;
    }

    if (!continue_signal_.wait_for(options_.pause_timeout)) {
        log(DebugLogLevel::WARNING,
            fmt::format("Pause timed out after {} ms, resuming", options_.pause_timeout.count()));
        resume_execution();
    }
}

// Flow executor callbacks

void ExecutionController::on_step_start(StepIndex step_index, const StepRecord& step) {
    const u64 session = continue_signal_.epoch();
    current_step_ = step_index;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_action_id_ = step.action_id;
    }
    metrics_->start_step_timer(step_index);

    bool blocked = false;

    // Manual pause requested from the controlling thread
    if (paused_) {
        wait_for_continue();
        blocked = true;
    }

    ExecutionMode mode = mode_;
    if (mode == ExecutionMode::STEP) {
        if (!blocked && pause_session(session)) {
            notify(step_execution_handler_, "step-execution", step_index, step);
            wait_for_continue();
        }
    } else if (mode == ExecutionMode::DEBUG) {
        auto matches = match_start_breakpoints(step_index, step);
        if (blocked) {
            for (const auto& match : matches) {
                registry_.record_hit(match.breakpoint_id);
            }
        } else {
            handle_matches(matches, session);
        }
    }

    log(DebugLogLevel::INFO, fmt::format("Step #{} ({}) started", step_index, step.action_id));
}

void ExecutionController::on_step_complete(StepIndex step_index, bool success, const std::string& message) {
    const u64 session = continue_signal_.epoch();
    metrics_->stop_step_timer(step_index);

    if (success) {
        log(DebugLogLevel::SUCCESS, fmt::format("Step #{} completed: {}", step_index, message));
    } else {
        log(DebugLogLevel::ERROR, fmt::format("Step #{} failed: {}", step_index, message));
    }

    report_watch_variables();

    ExecutionMode mode = mode_;
    std::vector<BreakpointMatch> matches;
    if (!success && mode == ExecutionMode::DEBUG) {
        matches = match_error_breakpoints(step_index, message);
    }
    if (mode != ExecutionMode::NORMAL) {
        auto variable_matches = match_variable_breakpoints();
        matches.insert(matches.end(), variable_matches.begin(), variable_matches.end());
    }
    handle_matches(matches, session);
}

void ExecutionController::on_step_complete(StepIndex step_index, bool success, const nlohmann::json& message) {
    std::string text;
    if (message.is_string()) {
        text = message.get<std::string>();
    } else if (message.is_object() && message.contains("message") && message["message"].is_string()) {
        text = message["message"].get<std::string>();
    } else {
        text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    on_step_complete(step_index, success, text);
}

void ExecutionController::on_flow_complete(bool success) {
    if (metrics_->is_monitoring()) {
        metrics_->stop_monitoring();
    }

    mode_ = ExecutionMode::NORMAL;
    paused_ = false;
    debugging_ = false;
    continue_signal_.release();

    if (success) {
        log(DebugLogLevel::SUCCESS, "Flow completed successfully");
    } else {
        log(DebugLogLevel::ERROR, "Flow failed");
    }

    auto memory = metrics_->get_average_memory_usage();
    log(DebugLogLevel::INFO, fmt::format("Execution summary: total time={:.2f}s, avg memory={:.2f}MB, avg CPU={:.2f}%",
                                         metrics_->get_total_execution_time(), memory.rss,
                                         metrics_->get_average_cpu_usage()));
}

// Breakpoint evaluation

std::vector<ExecutionController::BreakpointMatch>
ExecutionController::match_start_breakpoints(StepIndex step_index, const StepRecord& step) {
    std::vector<BreakpointMatch> matches;

    for (const auto& bp : registry_.enabled_of_type(BreakpointType::LINE)) {
        if (bp.targets(step_index)) {
            matches.push_back(BreakpointMatch{bp.id, step_index, step});
        }
    }

    auto conditions = registry_.enabled_of_type(BreakpointType::CONDITION);
    if (conditions.empty()) {
        return matches;
    }

    Environment env;
    if (const VariableStore* variables = store()) {
        env = ConditionEvaluator::build_environment(*variables);
    }

    for (const auto& bp : conditions) {
        if (!bp.targets(step_index) || bp.condition.empty()) {
            continue;
        }
        auto result = evaluator_.evaluate_condition(bp.condition, env);
        if (!result) {
            log(DebugLogLevel::ERROR, fmt::format("Condition breakpoint {} evaluation failed: {}",
                                                  bp.id, result.error().message()));
            continue;
        }
        if (result.value()) {
            matches.push_back(BreakpointMatch{bp.id, step_index, step});
        }
    }
    return matches;
}

std::vector<ExecutionController::BreakpointMatch>
ExecutionController::match_error_breakpoints(StepIndex step_index, const std::string& message) {
    std::vector<BreakpointMatch> matches;

    StepRecord context;
    context.action_id = current_action_id();
    context.parameters["error_message"] = Value(message);

    for (const auto& bp : registry_.enabled_of_type(BreakpointType::ERROR)) {
        if (bp.targets(step_index)) {
            matches.push_back(BreakpointMatch{bp.id, step_index, context});
        }
    }
    return matches;
}

std::vector<ExecutionController::BreakpointMatch> ExecutionController::match_variable_breakpoints() {
    std::vector<BreakpointMatch> matches;

    const VariableStore* variables = store();
    if (!variables) {
        return matches;
    }

    StepIndex step_index = current_step_;
    for (const auto& bp : registry_.enabled_of_type(BreakpointType::VARIABLE)) {
        if (!bp.targets(step_index)) {
            continue;
        }
        auto current = variables->get_variable(bp.variable_name);
        if (!current) {
            continue;
        }

        auto result = evaluator_.evaluate_variable(bp, *variables);
        if (!result) {
            log(DebugLogLevel::ERROR, fmt::format("Variable breakpoint {} evaluation failed: {}",
                                                  bp.id, result.error().message()));
            continue;
        }
        if (result.value()) {
            StepRecord context;
            context.parameters["variable_name"] = Value(bp.variable_name);
            context.parameters["variable_value"] = *current;
            matches.push_back(BreakpointMatch{bp.id, step_index, std::move(context)});
        }
    }
    return matches;
}

void ExecutionController::handle_matches(const std::vector<BreakpointMatch>& matches, u64 session) {
    if (matches.empty()) {
        return;
    }

    for (const auto& match : matches) {
        registry_.record_hit(match.breakpoint_id);
    }

    const auto& first = matches.front();
    log(DebugLogLevel::INFO, fmt::format("Breakpoint {} hit at step #{}", first.breakpoint_id, first.step_index));
    if (!pause_session(session)) {
        return;
    }
    notify(breakpoint_hit_handler_, "breakpoint-hit", first.breakpoint_id, first.step_index, first.context);
    wait_for_continue();
}

void ExecutionController::report_watch_variables() {
    const VariableStore* variables = store();
    if (!variables) {
        return;
    }
    for (const auto& name : get_watch_variables()) {
        auto value = variables->get_variable(name);
        if (value) {
            notify(variable_changed_handler_, "variable-changed", name, *value);
        }
    }
}

void ExecutionController::log(DebugLogLevel level, const std::string& message) {
    log_.add(level, message);
}

// Observers

void ExecutionController::set_breakpoint_hit_handler(BreakpointHitHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    breakpoint_hit_handler_ = std::move(handler);
}

void ExecutionController::set_step_execution_handler(StepExecutionHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    step_execution_handler_ = std::move(handler);
}

void ExecutionController::set_variable_changed_handler(VariableChangedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    variable_changed_handler_ = std::move(handler);
}

void ExecutionController::set_execution_paused_handler(ExecutionPausedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    execution_paused_handler_ = std::move(handler);
}

void ExecutionController::set_execution_resumed_handler(ExecutionResumedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    execution_resumed_handler_ = std::move(handler);
}

// Metrics and log passthroughs

nlohmann::json ExecutionController::get_performance_metrics() const {
    return metrics_->to_dict();
}

std::vector<DebugLogEntry> ExecutionController::get_debug_logs(std::optional<DebugLogLevel> filter_level) const {
    return log_.get_logs(filter_level);
}

void ExecutionController::clear_debug_logs() {
    log_.clear();
}

Result<std::string> ExecutionController::export_debug_logs(const std::string& path) const {
    return log_.export_text(path);
}

Result<std::string> ExecutionController::export_debug_logs_json(const std::string& path) const {
    return log_.export_json(path);
}

}  // namespace flowdebug
