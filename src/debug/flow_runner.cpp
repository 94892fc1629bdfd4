#include "flowdebug/debug/flow_runner.hpp"
#include "flowdebug/utils/logging.hpp"

namespace flowdebug {

DECLARE_LOGGER("FlowRunner");

namespace {

template<typename Handler, typename... Args>
void invoke_handler(std::mutex& mutex, const Handler& handler, const char* event, Args&&... args) {
    Handler callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        callback = handler;
    }
    if (!callback) {
        return;
    }
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        COMPONENT_LOG_ERROR("{} handler threw: {}", event, e.what());
    }
}

}  // namespace

DebugFlowRunner::DebugFlowRunner(ExecutionController& controller, VariableManager& variables)
    : controller_(controller), variables_(variables) {}

DebugFlowRunner::~DebugFlowRunner() {
    stop();
    join();
}

Result<void> DebugFlowRunner::start(std::vector<FlowStep> steps, ExecutionMode mode) {
    if (running_) {
        return unexpected(MAKE_ERROR(SYSTEM_ALREADY_RUNNING, "A flow is already running"));
    }
    if (steps.empty()) {
        return unexpected(MAKE_ERROR(FLOW_EMPTY, "Flow has no steps"));
    }

    join();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_result_.reset();
    }
    stop_requested_ = false;
    running_ = true;

    controller_.start_debugging(mode);

    COMPONENT_LOG_INFO("Starting flow with {} steps in {} mode", steps.size(), to_string(mode));
    worker_ = std::thread(&DebugFlowRunner::execution_loop, this, std::move(steps));
    return {};
}

void DebugFlowRunner::stop() {
    if (!running_) {
        return;
    }
    COMPONENT_LOG_INFO("Stop requested");
    stop_requested_ = true;
    controller_.stop_debugging();
}

void DebugFlowRunner::pause() {
    if (!controller_.is_paused()) {
        controller_.pause_execution();
    }
}

void DebugFlowRunner::resume() {
    if (controller_.is_paused()) {
        controller_.resume_execution();
    }
}

void DebugFlowRunner::step_over() {
    controller_.set_execution_mode(ExecutionMode::STEP);
    controller_.resume_execution();
}

void DebugFlowRunner::step_into() {
    // Steps have no inner structure to descend into
    step_over();
}

void DebugFlowRunner::step_out() {
    controller_.set_execution_mode(ExecutionMode::DEBUG);
    controller_.resume_execution();
}

std::string DebugFlowRunner::run_to_cursor(StepIndex step_index) {
    std::string id = controller_.add_breakpoint(Breakpoint::line(step_index));
    std::optional<std::pair<StepIndex, std::string>> previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = cursor_breakpoint_;
        cursor_breakpoint_ = std::make_pair(step_index, id);
    }
    if (previous) {
        controller_.remove_breakpoint(previous->second);
    }

    controller_.set_execution_mode(ExecutionMode::DEBUG);
    controller_.resume_execution();
    return id;
}

void DebugFlowRunner::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::optional<bool> DebugFlowRunner::last_result() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_result_;
}

void DebugFlowRunner::set_step_started_handler(StepStartedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    step_started_handler_ = std::move(handler);
}

void DebugFlowRunner::set_step_completed_handler(StepCompletedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    step_completed_handler_ = std::move(handler);
}

void DebugFlowRunner::set_flow_completed_handler(FlowCompletedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    flow_completed_handler_ = std::move(handler);
}

void DebugFlowRunner::execution_loop(std::vector<FlowStep> steps) {
    bool success = true;

    for (size_t i = 0; i < steps.size(); ++i) {
        if (stop_requested_) {
            success = false;
            break;
        }

        auto index = static_cast<StepIndex>(i);
        const FlowStep& step = steps[i];

        if (!step.enabled) {
            controller_.on_step_complete(index, true, std::string("skipped"));
            invoke_handler(handlers_mutex_, step_completed_handler_, "step-completed",
                           index, true, std::string("skipped"));
            continue;
        }

        StepRecord record{step.action_id, step.parameters};
        controller_.on_step_start(index, record);
        release_cursor_breakpoint(index);
        invoke_handler(handlers_mutex_, step_started_handler_, "step-started", index, record);

        // Stopped while paused before this step
        if (stop_requested_) {
            success = false;
            break;
        }

        auto [ok, message] = run_step(step);
        controller_.on_step_complete(index, ok, message);
        invoke_handler(handlers_mutex_, step_completed_handler_, "step-completed", index, ok, message);

        if (!ok) {
            COMPONENT_LOG_WARN("Step #{} ({}) failed, ending flow: {}", index, step.action_id, message);
            success = false;
            break;
        }
    }

    controller_.on_flow_complete(success);
    release_cursor_breakpoint(std::nullopt);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_result_ = success;
    }
    invoke_handler(handlers_mutex_, flow_completed_handler_, "flow-completed", success);

    controller_.stop_debugging();
    running_ = false;
    COMPONENT_LOG_INFO("Flow finished: {}", success ? "success" : "failure");
}

std::pair<bool, std::string> DebugFlowRunner::run_step(const FlowStep& step) {
    if (!step.action) {
        return {true, "Step " + step.action_id + " has no action"};
    }

    try {
        auto result = step.action(step, variables_);
        if (!result) {
            return {false, result.error().message()};
        }
        return {true, result.value()};
    } catch (const std::exception& e) {
        return {false, std::string("Step raised an exception: ") + e.what()};
    }
}

void DebugFlowRunner::release_cursor_breakpoint(std::optional<StepIndex> reached) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!cursor_breakpoint_) {
            return;
        }
        if (reached && *reached != cursor_breakpoint_->first) {
            return;
        }
        id = cursor_breakpoint_->second;
        cursor_breakpoint_.reset();
    }
    controller_.remove_breakpoint(id);
}

}  // namespace flowdebug
