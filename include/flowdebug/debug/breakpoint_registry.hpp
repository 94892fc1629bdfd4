#pragma once

#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/utils/error.hpp"
#include <nlohmann/json_fwd.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flowdebug {

/**
 * @brief Breakpoint definitions of one debugging session
 *
 * Breakpoints keep their insertion order, which is also the order in
 * which they are evaluated. Unknown IDs are reported through return
 * values, never by throwing.
 */
class BreakpointRegistry {
public:
    BreakpointRegistry() = default;

    // Returns the breakpoint's ID; an empty ID is replaced by a generated one
    std::string add(Breakpoint breakpoint);
    bool remove(const std::string& id);
    std::optional<Breakpoint> get(const std::string& id) const;
    std::vector<Breakpoint> list() const;
    void clear();
    bool set_enabled(const std::string& id, bool enabled);

    /**
     * @brief Remove the LINE breakpoint at a step, or create one
     * @return (true, new id) when created, (true, message) when removed
     */
    std::pair<bool, std::string> toggle(StepIndex step_index);

    // Enabled breakpoints of one type, in evaluation order
    std::vector<Breakpoint> enabled_of_type(BreakpointType type) const;

    // Increments hit_count of an enabled breakpoint; false if unknown or disabled
    bool record_hit(const std::string& id);

    size_t size() const;
    bool empty() const;

    nlohmann::json to_json() const;
    Result<size_t> load_json(const nlohmann::json& data, bool replace = true);

    Result<std::string> save(const std::string& path) const;
    Result<size_t> load(const std::string& path, bool replace = true);

private:
    std::string generate_id();

    std::vector<Breakpoint> breakpoints_;
    u64 next_breakpoint_id_ = 1;
    mutable std::mutex breakpoints_mutex_;
};

}  // namespace flowdebug
