#pragma once

#include "flowdebug/core/variable_store.hpp"
#include "flowdebug/debug/condition.hpp"
#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/utils/error.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace flowdebug {

/**
 * @brief Evaluates CONDITION and VARIABLE breakpoints against the variable store
 *
 * Never throws. Every failure (parse error, unknown variable, type
 * mismatch) comes back as an error result, which the controller logs and
 * treats as "not matched".
 */
class ConditionEvaluator {
public:
    ConditionEvaluator() = default;

    // Parsed conditions are cached by expression text
    Result<bool> evaluate_condition(const std::string& expression, const Environment& env);
    Result<bool> evaluate_condition(const std::string& expression, const VariableStore& store);

    // Compares the variable's current value with the breakpoint's value
    Result<bool> evaluate_variable(const Breakpoint& breakpoint, const VariableStore& store) const;

    // Rejects expressions outside the condition grammar without evaluating them
    static Result<void> validate(const std::string& expression);

    static Environment build_environment(const VariableStore& store);

    void clear_cache();

private:
    Result<std::shared_ptr<const Condition>> parse_cached(const std::string& expression);

    std::unordered_map<std::string, std::shared_ptr<const Condition>> cache_;
    std::mutex cache_mutex_;
};

}  // namespace flowdebug
