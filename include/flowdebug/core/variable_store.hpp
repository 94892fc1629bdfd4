#pragma once

#include "flowdebug/core/value.hpp"
#include <map>
#include <optional>
#include <string>

namespace flowdebug {

struct VariableInfo {
    std::string name;
    Value value;
    std::string type;
    std::string scope;
    std::string description;
};

using VariableSnapshot = std::map<std::string, VariableInfo>;

/**
 * @brief Read-only view of the flow's variables
 *
 * The execution controller only queries variables through this interface;
 * it never owns or mutates the store.
 */
class VariableStore {
public:
    virtual ~VariableStore() = default;

    virtual std::optional<Value> get_variable(const std::string& name) const = 0;
    virtual VariableSnapshot get_all_variables() const = 0;
};

}  // namespace flowdebug
