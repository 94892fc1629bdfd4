#pragma once

#include "flowdebug/core/value.hpp"
#include "flowdebug/utils/types.hpp"
#include "flowdebug/utils/error.hpp"
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <string>

namespace flowdebug {

// Execution modes
enum class ExecutionMode {
    NORMAL,     // Never pauses
    DEBUG,      // Pauses when a breakpoint matches
    STEP        // Pauses before every step
};

// Breakpoint types
enum class BreakpointType {
    LINE,       // Break before a given step
    CONDITION,  // Break before a step when an expression holds
    ERROR,      // Break after a failed step
    VARIABLE    // Break after a step when a variable comparison holds
};

// Severity of a debug log entry
enum class DebugLogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    SUCCESS
};

const char* to_string(ExecutionMode mode) noexcept;
Result<ExecutionMode> execution_mode_from_string(const std::string& text);

const char* to_string(BreakpointType type) noexcept;
Result<BreakpointType> breakpoint_type_from_string(const std::string& text);

const char* to_string(DebugLogLevel level) noexcept;
Result<DebugLogLevel> debug_log_level_from_string(const std::string& text);

// One step as the flow executor hands it over
struct StepRecord {
    std::string action_id;
    std::map<std::string, Value> parameters;
};

// Breakpoint structure
struct Breakpoint {
    std::string id;
    StepIndex step_index = kAnyStep;
    BreakpointType type = BreakpointType::LINE;
    std::string condition;                      // CONDITION only
    std::string variable_name;                  // VARIABLE only
    Value variable_value;                       // VARIABLE only
    ComparisonOperator comparison_operator = ComparisonOperator::EQUAL;
    bool enabled = true;
    u64 hit_count = 0;

    static Breakpoint line(StepIndex step_index);
    static Breakpoint conditional(StepIndex step_index, const std::string& expression);
    static Breakpoint error(StepIndex step_index = kAnyStep);
    static Breakpoint variable(const std::string& name, ComparisonOperator op, const Value& value);

    // kAnyStep matches every step
    bool targets(StepIndex index) const {
        return step_index == kAnyStep || step_index == index;
    }

    /**
     * @brief Serialize to the persisted breakpoint dictionary
     *
     * Layout: {id, step_index, type, condition, variable_name,
     * variable_value (stringified), comparison_operator, enabled, hit_count}.
     */
    nlohmann::json to_dict() const;

    /**
     * @brief Rebuild a breakpoint from its dictionary form
     *
     * Missing fields take their defaults (hit_count 0, enabled true,
     * operator "=="); a stringified variable_value is parsed back into a
     * typed value where it reads as a literal.
     */
    static Result<Breakpoint> from_dict(const nlohmann::json& data);
};

}  // namespace flowdebug
