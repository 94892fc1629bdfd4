#pragma once

#include "flowdebug/core/variable_store.hpp"
#include "flowdebug/utils/error.hpp"
#include <array>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowdebug {

enum class VariableScope {
    GLOBAL,
    LOCAL,
    TEMPORARY
};

const char* to_string(VariableScope scope) noexcept;
Result<VariableScope> variable_scope_from_string(const std::string& text);

/**
 * @brief Scoped variable storage for a running flow
 *
 * Lookups resolve TEMPORARY first, then LOCAL, then GLOBAL. All methods
 * are safe to call concurrently: the flow's worker thread writes while
 * the controller thread reads snapshots.
 */
class VariableManager : public VariableStore {
public:
    VariableManager() = default;
    ~VariableManager() override = default;

    Result<void> create_variable(const std::string& name, const Value& value,
                                 VariableScope scope = VariableScope::GLOBAL,
                                 const std::string& description = "");

    // Updates an existing variable; without a scope the highest-priority match is used
    Result<void> set_variable(const std::string& name, const Value& value);
    Result<void> set_variable(const std::string& name, const Value& value, VariableScope scope);

    Result<void> delete_variable(const std::string& name);
    Result<void> delete_variable(const std::string& name, VariableScope scope);

    bool has_variable(const std::string& name) const;
    void clear_scope(VariableScope scope);
    void clear();

    std::optional<Value> get_variable(const std::string& name) const override;
    VariableSnapshot get_all_variables() const override;
    VariableSnapshot get_all_variables(VariableScope scope) const;

    static bool is_valid_name(const std::string& name);

private:
    struct Entry {
        Value value;
        std::string description;
    };

    using ScopeTable = std::unordered_map<std::string, Entry>;

    static constexpr std::array<VariableScope, 3> kLookupOrder = {
        VariableScope::TEMPORARY, VariableScope::LOCAL, VariableScope::GLOBAL};

    ScopeTable& table(VariableScope scope) { return scopes_[static_cast<size_t>(scope)]; }
    const ScopeTable& table(VariableScope scope) const { return scopes_[static_cast<size_t>(scope)]; }

    std::array<ScopeTable, 3> scopes_;
    mutable std::shared_mutex mutex_;
};

}  // namespace flowdebug
