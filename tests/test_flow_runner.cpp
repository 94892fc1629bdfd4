#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "flowdebug/debug/flow_runner.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace flowdebug::test {

using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

// Increments "counter" and reports the new value
FlowStep counting_step(const std::string& action_id) {
    FlowStep step;
    step.action_id = action_id;
    step.action = [](const FlowStep&, VariableManager& variables) -> Result<std::string> {
        auto current = variables.get_variable("counter");
        i64 next = current && current->is_integer() ? current->as_integer() + 1 : 1;
        RETURN_IF_ERROR(variables.create_variable("counter", Value(next)));
        return "counter=" + std::to_string(next);
    };
    return step;
}

FlowStep failing_step(const std::string& action_id) {
    FlowStep step;
    step.action_id = action_id;
    step.action = [](const FlowStep&, VariableManager&) -> Result<std::string> {
        return unexpected(MAKE_ERROR(STEP_FAILED, "element not found"));
    };
    return step;
}

}  // namespace

class FlowRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ExecutionController::Options options;
        options.mirror_to_logger = false;
        options.sample_resources = false;
        controller = std::make_unique<ExecutionController>(&variables, options);
        runner = std::make_unique<DebugFlowRunner>(*controller, variables);

        runner->set_step_started_handler([this](StepIndex step_index, const StepRecord&) {
            std::lock_guard<std::mutex> lock(events_mutex);
            started.push_back(step_index);
        });
        runner->set_step_completed_handler([this](StepIndex step_index, bool success, const std::string& message) {
            std::lock_guard<std::mutex> lock(events_mutex);
            completed.push_back({step_index, success, message});
        });
    }

    void TearDown() override {
        runner.reset();
    }

    std::vector<StepIndex> started_steps() {
        std::lock_guard<std::mutex> lock(events_mutex);
        return started;
    }

    struct Completion {
        StepIndex step_index;
        bool success;
        std::string message;
    };

    std::vector<Completion> completions() {
        std::lock_guard<std::mutex> lock(events_mutex);
        return completed;
    }

    VariableManager variables;
    std::unique_ptr<ExecutionController> controller;
    std::unique_ptr<DebugFlowRunner> runner;

    std::mutex events_mutex;
    std::vector<StepIndex> started;
    std::vector<Completion> completed;
};

TEST_F(FlowRunnerTest, RunsFlowToCompletion) {
    std::atomic<bool> flow_success{false};
    runner->set_flow_completed_handler([&](bool success) { flow_success = success; });

    std::vector<FlowStep> steps{counting_step("a"), counting_step("b"), counting_step("c")};
    ASSERT_TRUE(runner->start(std::move(steps), ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_FALSE(runner->is_running());
    ASSERT_TRUE(runner->last_result().has_value());
    EXPECT_TRUE(*runner->last_result());
    EXPECT_TRUE(flow_success);
    EXPECT_THAT(started_steps(), ElementsAre(0, 1, 2));
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(3));

    auto done = completions();
    ASSERT_EQ(done.size(), 3u);
    EXPECT_EQ(done[2].message, "counter=3");
}

TEST_F(FlowRunnerTest, RejectsEmptyFlow) {
    auto result = runner->start({});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FLOW_EMPTY);
}

TEST_F(FlowRunnerTest, RejectsSecondStartWhileRunning) {
    controller->add_breakpoint(Breakpoint::line(0));
    ASSERT_TRUE(runner->start({counting_step("a")}, ExecutionMode::DEBUG).has_value());
    ASSERT_TRUE(wait_until([&]() { return runner->is_paused(); }));

    auto second = runner->start({counting_step("b")});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code(), ErrorCode::SYSTEM_ALREADY_RUNNING);

    runner->resume();
    runner->join();
    EXPECT_TRUE(*runner->last_result());
}

TEST_F(FlowRunnerTest, FirstFailureEndsFlow) {
    std::vector<FlowStep> steps{counting_step("a"), failing_step("b"), counting_step("c")};
    ASSERT_TRUE(runner->start(std::move(steps), ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_FALSE(*runner->last_result());
    EXPECT_THAT(started_steps(), ElementsAre(0, 1));

    auto done = completions();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_FALSE(done[1].success);
    EXPECT_EQ(done[1].message, "element not found");
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(1));
}

TEST_F(FlowRunnerTest, DisabledStepIsSkipped) {
    FlowStep disabled = counting_step("b");
    disabled.enabled = false;

    std::vector<FlowStep> steps{counting_step("a"), disabled, counting_step("c")};
    ASSERT_TRUE(runner->start(std::move(steps), ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_THAT(started_steps(), ElementsAre(0, 2));
    auto done = completions();
    ASSERT_EQ(done.size(), 3u);
    EXPECT_EQ(done[1].message, "skipped");
    EXPECT_TRUE(done[1].success);
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(2));
}

TEST_F(FlowRunnerTest, StepWithoutActionSucceeds) {
    FlowStep placeholder;
    placeholder.action_id = "noop";
    ASSERT_TRUE(runner->start({placeholder}, ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_TRUE(*runner->last_result());
    EXPECT_EQ(completions().at(0).message, "Step noop has no action");
}

TEST_F(FlowRunnerTest, ThrowingActionFailsStep) {
    FlowStep step;
    step.action_id = "explode";
    step.action = [](const FlowStep&, VariableManager&) -> Result<std::string> {
        throw std::runtime_error("driver crashed");
    };

    ASSERT_TRUE(runner->start({step}, ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_FALSE(*runner->last_result());
    auto done = completions();
    ASSERT_EQ(done.size(), 1u);
    EXPECT_THAT(done[0].message, HasSubstr("driver crashed"));
}

TEST_F(FlowRunnerTest, StopWhilePausedEndsFlow) {
    ASSERT_TRUE(runner->start({counting_step("a"), counting_step("b")}, ExecutionMode::STEP).has_value());
    ASSERT_TRUE(wait_until([&]() { return runner->is_paused(); }));

    runner->stop();
    runner->join();

    EXPECT_FALSE(runner->is_running());
    EXPECT_FALSE(*runner->last_result());
    EXPECT_TRUE(completions().empty());
    EXPECT_FALSE(variables.get_variable("counter").has_value());
}

TEST_F(FlowRunnerTest, StepOverAdvancesOneStep) {
    ASSERT_TRUE(runner->start({counting_step("a"), counting_step("b"), counting_step("c")},
                              ExecutionMode::STEP).has_value());

    ASSERT_TRUE(wait_until([&]() { return runner->is_paused() && controller->current_step_index() == 0; }));
    runner->step_over();
    ASSERT_TRUE(wait_until([&]() { return runner->is_paused() && controller->current_step_index() == 1; }));
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(1));

    // Leave step mode and let the rest run
    runner->step_out();
    runner->join();
    EXPECT_TRUE(*runner->last_result());
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(3));
}

TEST_F(FlowRunnerTest, RunToCursorStopsAtTargetOnce) {
    std::vector<FlowStep> steps;
    for (int i = 0; i < 5; ++i) {
        steps.push_back(counting_step("s" + std::to_string(i)));
    }
    ASSERT_TRUE(runner->start(std::move(steps), ExecutionMode::STEP).has_value());
    ASSERT_TRUE(wait_until([&]() { return runner->is_paused(); }));

    runner->run_to_cursor(3);
    ASSERT_TRUE(wait_until([&]() { return runner->is_paused() && controller->current_step_index() == 3; }));
    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(3));

    runner->resume();
    runner->join();
    EXPECT_TRUE(*runner->last_result());

    // The temporary breakpoint is gone once reached
    EXPECT_TRUE(controller->get_all_breakpoints().empty());
}

TEST_F(FlowRunnerTest, PauseAndResumeFromController) {
    std::atomic<bool> gate{false};
    FlowStep slow;
    slow.action_id = "slow";
    slow.action = [&](const FlowStep&, VariableManager&) -> Result<std::string> {
        while (!gate) {
            std::this_thread::sleep_for(1ms);
        }
        return std::string("done");
    };

    ASSERT_TRUE(runner->start({slow, counting_step("next")}, ExecutionMode::DEBUG).has_value());
    ASSERT_TRUE(wait_until([&]() { return started_steps().size() == 1; }));

    runner->pause();
    gate = true;

    // Held before step 1
    ASSERT_TRUE(wait_until([&]() { return completions().size() == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(started_steps().size(), 1u);

    runner->resume();
    runner->join();
    EXPECT_EQ(started_steps().size(), 2u);
    EXPECT_TRUE(*runner->last_result());
}

TEST_F(FlowRunnerTest, RunnerCanBeRestarted) {
    ASSERT_TRUE(runner->start({counting_step("a")}, ExecutionMode::NORMAL).has_value());
    runner->join();
    ASSERT_TRUE(runner->start({counting_step("b")}, ExecutionMode::NORMAL).has_value());
    runner->join();

    EXPECT_EQ(variables.get_variable("counter").value_or(Value()), Value(2));
    EXPECT_TRUE(*runner->last_result());
}

}  // namespace flowdebug::test
