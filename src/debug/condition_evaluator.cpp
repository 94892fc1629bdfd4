#include "flowdebug/debug/condition_evaluator.hpp"

namespace flowdebug {

Result<std::shared_ptr<const Condition>> ConditionEvaluator::parse_cached(const std::string& expression) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_.find(expression);
    if (it != cache_.end()) {
        return it->second;
    }

    auto parsed = ConditionParser::parse(expression);
    if (!parsed) {
        return unexpected(parsed.error());
    }

    auto condition = std::make_shared<const Condition>(std::move(parsed.value()));
    cache_.emplace(expression, condition);
    return condition;
}

Result<bool> ConditionEvaluator::evaluate_condition(const std::string& expression, const Environment& env) {
    auto condition = parse_cached(expression);
    if (!condition) {
        return unexpected(condition.error());
    }
    return condition.value()->evaluate(env);
}

Result<bool> ConditionEvaluator::evaluate_condition(const std::string& expression, const VariableStore& store) {
    return evaluate_condition(expression, build_environment(store));
}

Result<bool> ConditionEvaluator::evaluate_variable(const Breakpoint& breakpoint, const VariableStore& store) const {
    if (breakpoint.type != BreakpointType::VARIABLE) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID,
            "Breakpoint " + breakpoint.id + " is not a variable breakpoint"));
    }

    auto current = store.get_variable(breakpoint.variable_name);
    if (!current) {
        return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND,
            "Variable '" + breakpoint.variable_name + "' is not defined"));
    }

    // For in / not in the current value is looked up inside the breakpoint's value
    return compare_values(*current, breakpoint.comparison_operator, breakpoint.variable_value);
}

Result<void> ConditionEvaluator::validate(const std::string& expression) {
    auto parsed = ConditionParser::parse(expression);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    return {};
}

Environment ConditionEvaluator::build_environment(const VariableStore& store) {
    Environment env;
    for (const auto& [name, info] : store.get_all_variables()) {
        env.emplace(name, info.value);
    }
    return env;
}

void ConditionEvaluator::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

}  // namespace flowdebug
