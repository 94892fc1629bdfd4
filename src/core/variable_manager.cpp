#include "flowdebug/core/variable_manager.hpp"
#include "flowdebug/utils/logging.hpp"
#include <cctype>
#include <mutex>

namespace flowdebug {

DECLARE_LOGGER("VariableManager");

const char* to_string(VariableScope scope) noexcept {
    switch (scope) {
        case VariableScope::GLOBAL: return "global";
        case VariableScope::LOCAL: return "local";
        case VariableScope::TEMPORARY: return "temp";
    }
    return "global";
}

Result<VariableScope> variable_scope_from_string(const std::string& text) {
    if (text == "global") return VariableScope::GLOBAL;
    if (text == "local") return VariableScope::LOCAL;
    if (text == "temp" || text == "temporary") return VariableScope::TEMPORARY;
    return unexpected(MAKE_ERROR(VARIABLE_INVALID_SCOPE, "Unknown variable scope: " + text));
}

bool VariableManager::is_valid_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

Result<void> VariableManager::create_variable(const std::string& name, const Value& value,
                                              VariableScope scope, const std::string& description) {
    if (!is_valid_name(name)) {
        return unexpected(MAKE_ERROR(VARIABLE_INVALID_NAME,
            "Invalid variable name '" + name + "': use letters, digits and underscores, not starting with a digit"));
    }

    std::unique_lock lock(mutex_);
    table(scope)[name] = Entry{value, description};

    COMPONENT_LOG_DEBUG("Created variable '{}' ({}, scope {})", name, value.type_name(), to_string(scope));
    return {};
}

Result<void> VariableManager::set_variable(const std::string& name, const Value& value) {
    std::unique_lock lock(mutex_);
    for (auto scope : kLookupOrder) {
        auto& scope_table = table(scope);
        auto it = scope_table.find(name);
        if (it != scope_table.end()) {
            it->second.value = value;
            return {};
        }
    }
    return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND, "Variable '" + name + "' does not exist in any scope"));
}

Result<void> VariableManager::set_variable(const std::string& name, const Value& value, VariableScope scope) {
    std::unique_lock lock(mutex_);
    auto& scope_table = table(scope);
    auto it = scope_table.find(name);
    if (it == scope_table.end()) {
        return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND,
            "Variable '" + name + "' does not exist in scope '" + to_string(scope) + "'"));
    }
    it->second.value = value;
    return {};
}

Result<void> VariableManager::delete_variable(const std::string& name) {
    std::unique_lock lock(mutex_);
    for (auto scope : kLookupOrder) {
        if (table(scope).erase(name) > 0) {
            return {};
        }
    }
    return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND, "Variable '" + name + "' does not exist in any scope"));
}

Result<void> VariableManager::delete_variable(const std::string& name, VariableScope scope) {
    std::unique_lock lock(mutex_);
    if (table(scope).erase(name) == 0) {
        return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND,
            "Variable '" + name + "' does not exist in scope '" + to_string(scope) + "'"));
    }
    return {};
}

bool VariableManager::has_variable(const std::string& name) const {
    return get_variable(name).has_value();
}

void VariableManager::clear_scope(VariableScope scope) {
    std::unique_lock lock(mutex_);
    table(scope).clear();
}

void VariableManager::clear() {
    std::unique_lock lock(mutex_);
    for (auto& scope_table : scopes_) {
        scope_table.clear();
    }
}

std::optional<Value> VariableManager::get_variable(const std::string& name) const {
    std::shared_lock lock(mutex_);
    for (auto scope : kLookupOrder) {
        const auto& scope_table = table(scope);
        auto it = scope_table.find(name);
        if (it != scope_table.end()) {
            return it->second.value;
        }
    }
    return std::nullopt;
}

VariableSnapshot VariableManager::get_all_variables() const {
    std::shared_lock lock(mutex_);
    VariableSnapshot snapshot;
    // Lowest priority first so higher-priority scopes overwrite shadowed names
    for (auto it = kLookupOrder.rbegin(); it != kLookupOrder.rend(); ++it) {
        for (const auto& [name, entry] : table(*it)) {
            snapshot[name] = VariableInfo{name, entry.value, entry.value.type_name(),
                                          to_string(*it), entry.description};
        }
    }
    return snapshot;
}

VariableSnapshot VariableManager::get_all_variables(VariableScope scope) const {
    std::shared_lock lock(mutex_);
    VariableSnapshot snapshot;
    for (const auto& [name, entry] : table(scope)) {
        snapshot[name] = VariableInfo{name, entry.value, entry.value.type_name(),
                                      to_string(scope), entry.description};
    }
    return snapshot;
}

}  // namespace flowdebug
