#pragma once

#include "flowdebug/core/variable_manager.hpp"
#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/debug/execution_controller.hpp"
#include "flowdebug/utils/error.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace flowdebug {

struct FlowStep;

// Runs one step; the returned text becomes the step's completion message
using StepAction = std::function<Result<std::string>(const FlowStep& step, VariableManager& variables)>;

struct FlowStep {
    std::string action_id;
    std::map<std::string, Value> parameters;
    bool enabled = true;
    StepAction action;
};

/**
 * @brief Executes a flow on a worker thread under an ExecutionController
 *
 * Steps run strictly in order. Disabled steps are reported complete
 * ("skipped") without a start event. The first failed step ends the flow;
 * that decision belongs to the runner, the controller only observes it.
 */
class DebugFlowRunner {
public:
    using StepStartedHandler = std::function<void(StepIndex step_index, const StepRecord& step)>;
    using StepCompletedHandler = std::function<void(StepIndex step_index, bool success, const std::string& message)>;
    using FlowCompletedHandler = std::function<void(bool success)>;

    DebugFlowRunner(ExecutionController& controller, VariableManager& variables);
    ~DebugFlowRunner();

    DebugFlowRunner(const DebugFlowRunner&) = delete;
    DebugFlowRunner& operator=(const DebugFlowRunner&) = delete;

    Result<void> start(std::vector<FlowStep> steps, ExecutionMode mode = ExecutionMode::DEBUG);

    // Cooperative: the current step finishes, no further step starts
    void stop();

    void pause();
    void resume();

    void step_over();
    void step_into();
    void step_out();

    // Runs until the given step is about to start; the temporary breakpoint is removed once hit
    std::string run_to_cursor(StepIndex step_index);

    void join();
    bool is_running() const { return running_; }
    bool is_paused() const { return controller_.is_paused(); }

    // Outcome of the last completed run
    std::optional<bool> last_result() const;

    void set_step_started_handler(StepStartedHandler handler);
    void set_step_completed_handler(StepCompletedHandler handler);
    void set_flow_completed_handler(FlowCompletedHandler handler);

private:
    void execution_loop(std::vector<FlowStep> steps);
    std::pair<bool, std::string> run_step(const FlowStep& step);
    void release_cursor_breakpoint(std::optional<StepIndex> reached);

    ExecutionController& controller_;
    VariableManager& variables_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex state_mutex_;
    std::optional<bool> last_result_;
    std::optional<std::pair<StepIndex, std::string>> cursor_breakpoint_;

    mutable std::mutex handlers_mutex_;
    StepStartedHandler step_started_handler_;
    StepCompletedHandler step_completed_handler_;
    FlowCompletedHandler flow_completed_handler_;
};

}  // namespace flowdebug
