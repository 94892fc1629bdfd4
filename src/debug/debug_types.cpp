#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/debug/condition.hpp"
#include <nlohmann/json.hpp>

namespace flowdebug {

namespace {

// Strings that would read back as another literal keep their quotes
std::string stringify_value(const Value& value) {
    if (value.is_string()) {
        Value reparsed = parse_literal(value.as_string());
        if (reparsed.is_string() && reparsed.as_string() == value.as_string()) {
            return value.as_string();
        }
        return value.repr();
    }
    return value.to_string();
}

}  // namespace

const char* to_string(ExecutionMode mode) noexcept {
    switch (mode) {
        case ExecutionMode::NORMAL: return "normal";
        case ExecutionMode::DEBUG: return "debug";
        case ExecutionMode::STEP: return "step";
    }
    return "normal";
}

Result<ExecutionMode> execution_mode_from_string(const std::string& text) {
    if (text == "normal") return ExecutionMode::NORMAL;
    if (text == "debug") return ExecutionMode::DEBUG;
    if (text == "step") return ExecutionMode::STEP;
    return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Unknown execution mode: " + text));
}

const char* to_string(BreakpointType type) noexcept {
    switch (type) {
        case BreakpointType::LINE: return "line";
        case BreakpointType::CONDITION: return "condition";
        case BreakpointType::ERROR: return "error";
        case BreakpointType::VARIABLE: return "variable";
    }
    return "line";
}

Result<BreakpointType> breakpoint_type_from_string(const std::string& text) {
    if (text == "line") return BreakpointType::LINE;
    if (text == "condition") return BreakpointType::CONDITION;
    if (text == "error") return BreakpointType::ERROR;
    if (text == "variable") return BreakpointType::VARIABLE;
    return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Unknown breakpoint type: " + text));
}

const char* to_string(DebugLogLevel level) noexcept {
    switch (level) {
        case DebugLogLevel::DEBUG: return "DEBUG";
        case DebugLogLevel::INFO: return "INFO";
        case DebugLogLevel::WARNING: return "WARNING";
        case DebugLogLevel::ERROR: return "ERROR";
        case DebugLogLevel::SUCCESS: return "SUCCESS";
    }
    return "INFO";
}

Result<DebugLogLevel> debug_log_level_from_string(const std::string& text) {
    if (text == "DEBUG") return DebugLogLevel::DEBUG;
    if (text == "INFO") return DebugLogLevel::INFO;
    if (text == "WARNING") return DebugLogLevel::WARNING;
    if (text == "ERROR") return DebugLogLevel::ERROR;
    if (text == "SUCCESS") return DebugLogLevel::SUCCESS;
    return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Unknown log level: " + text));
}

Breakpoint Breakpoint::line(StepIndex step_index) {
    Breakpoint bp;
    bp.step_index = step_index;
    bp.type = BreakpointType::LINE;
    return bp;
}

Breakpoint Breakpoint::conditional(StepIndex step_index, const std::string& expression) {
    Breakpoint bp;
    bp.step_index = step_index;
    bp.type = BreakpointType::CONDITION;
    bp.condition = expression;
    return bp;
}

Breakpoint Breakpoint::error(StepIndex step_index) {
    Breakpoint bp;
    bp.step_index = step_index;
    bp.type = BreakpointType::ERROR;
    return bp;
}

Breakpoint Breakpoint::variable(const std::string& name, ComparisonOperator op, const Value& value) {
    Breakpoint bp;
    bp.step_index = kAnyStep;
    bp.type = BreakpointType::VARIABLE;
    bp.variable_name = name;
    bp.comparison_operator = op;
    bp.variable_value = value;
    return bp;
}

nlohmann::json Breakpoint::to_dict() const {
    return nlohmann::json{
        {"id", id},
        {"step_index", step_index},
        {"type", to_string(type)},
        {"condition", condition},
        {"variable_name", variable_name},
        {"variable_value", stringify_value(variable_value)},
        {"comparison_operator", to_string(comparison_operator)},
        {"enabled", enabled},
        {"hit_count", hit_count}
    };
}

Result<Breakpoint> Breakpoint::from_dict(const nlohmann::json& data) {
    if (!data.is_object()) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Breakpoint entry must be a JSON object"));
    }

    Breakpoint bp;
    try {
        bp.id = data.value("id", std::string());
        bp.step_index = data.value("step_index", kAnyStep);
        bp.condition = data.value("condition", std::string());
        bp.variable_name = data.value("variable_name", std::string());
        bp.enabled = data.value("enabled", true);
        bp.hit_count = data.value("hit_count", u64{0});

        auto type = breakpoint_type_from_string(data.value("type", std::string("line")));
        if (!type) {
            return unexpected(type.error());
        }
        bp.type = type.value();

        auto op = comparison_operator_from_string(data.value("comparison_operator", std::string("==")));
        if (!op) {
            return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, op.error().message()));
        }
        bp.comparison_operator = op.value();

        if (data.contains("variable_value")) {
            const auto& raw = data.at("variable_value");
            if (raw.is_string()) {
                bp.variable_value = parse_literal(raw.get<std::string>());
            } else {
                bp.variable_value = raw.get<Value>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, std::string("Malformed breakpoint entry: ") + e.what()));
    }

    if (bp.type == BreakpointType::CONDITION && bp.condition.empty()) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Condition breakpoint without an expression"));
    }
    if (bp.type == BreakpointType::VARIABLE && bp.variable_name.empty()) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Variable breakpoint without a variable name"));
    }
    return bp;
}

}  // namespace flowdebug
