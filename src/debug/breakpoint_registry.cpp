#include "flowdebug/debug/breakpoint_registry.hpp"
#include "flowdebug/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace flowdebug {

using json = nlohmann::json;

DECLARE_LOGGER("BreakpointRegistry");

std::string BreakpointRegistry::generate_id() {
    std::string id;
    do {
        id = "bp" + std::to_string(next_breakpoint_id_++);
    } while (std::any_of(breakpoints_.begin(), breakpoints_.end(),
                         [&id](const Breakpoint& bp) { return bp.id == id; }));
    return id;
}

std::string BreakpointRegistry::add(Breakpoint breakpoint) {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);

    if (breakpoint.id.empty()) {
        breakpoint.id = generate_id();
    }

    auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                           [&breakpoint](const Breakpoint& bp) { return bp.id == breakpoint.id; });
    if (it != breakpoints_.end()) {
        *it = breakpoint;
        COMPONENT_LOG_DEBUG("Breakpoint {} replaced", breakpoint.id);
    } else {
        breakpoints_.push_back(breakpoint);
        COMPONENT_LOG_DEBUG("Breakpoint {} added ({} at step {})",
                            breakpoint.id, to_string(breakpoint.type), breakpoint.step_index);
    }
    return breakpoint.id;
}

bool BreakpointRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                           [&id](const Breakpoint& bp) { return bp.id == id; });
    if (it == breakpoints_.end()) {
        COMPONENT_LOG_WARN("Breakpoint {} not found for removal", id);
        return false;
    }
    breakpoints_.erase(it);
    return true;
}

std::optional<Breakpoint> BreakpointRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    for (const auto& bp : breakpoints_) {
        if (bp.id == id) {
            return bp;
        }
    }
    return std::nullopt;
}

std::vector<Breakpoint> BreakpointRegistry::list() const {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    return breakpoints_;
}

void BreakpointRegistry::clear() {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    breakpoints_.clear();
}

bool BreakpointRegistry::set_enabled(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    for (auto& bp : breakpoints_) {
        if (bp.id == id) {
            bp.enabled = enabled;
            COMPONENT_LOG_INFO("Breakpoint {} {}", id, enabled ? "enabled" : "disabled");
            return true;
        }
    }
    COMPONENT_LOG_WARN("Breakpoint {} not found for enable/disable", id);
    return false;
}

std::pair<bool, std::string> BreakpointRegistry::toggle(StepIndex step_index) {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);

    auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(), [step_index](const Breakpoint& bp) {
        return bp.type == BreakpointType::LINE && bp.step_index == step_index;
    });
    if (it != breakpoints_.end()) {
        std::string id = it->id;
        breakpoints_.erase(it);
        return {true, "Removed breakpoint #" + id};
    }

    Breakpoint bp = Breakpoint::line(step_index);
    bp.id = generate_id();
    breakpoints_.push_back(bp);
    return {true, bp.id};
}

std::vector<Breakpoint> BreakpointRegistry::enabled_of_type(BreakpointType type) const {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    std::vector<Breakpoint> result;
    for (const auto& bp : breakpoints_) {
        if (bp.enabled && bp.type == type) {
            result.push_back(bp);
        }
    }
    return result;
}

bool BreakpointRegistry::record_hit(const std::string& id) {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    for (auto& bp : breakpoints_) {
        if (bp.id == id) {
            if (!bp.enabled) {
                return false;
            }
            ++bp.hit_count;
            return true;
        }
    }
    return false;
}

size_t BreakpointRegistry::size() const {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    return breakpoints_.size();
}

bool BreakpointRegistry::empty() const {
    return size() == 0;
}

json BreakpointRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(breakpoints_mutex_);
    json array = json::array();
    for (const auto& bp : breakpoints_) {
        array.push_back(bp.to_dict());
    }
    return array;
}

Result<size_t> BreakpointRegistry::load_json(const json& data, bool replace) {
    if (!data.is_array()) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Breakpoint list must be a JSON array"));
    }

    // Parse everything before touching the registry
    std::vector<Breakpoint> loaded;
    loaded.reserve(data.size());
    for (const auto& entry : data) {
        auto bp = Breakpoint::from_dict(entry);
        if (!bp) {
            return unexpected(bp.error());
        }
        loaded.push_back(std::move(bp.value()));
    }

    if (replace) {
        clear();
    }
    for (auto& bp : loaded) {
        add(std::move(bp));
    }
    return loaded.size();
}

Result<std::string> BreakpointRegistry::save(const std::string& path) const {
    std::string content = to_json().dump(2);

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot open " + path + " for writing"));
    }
    file << content;
    if (!file) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Failed writing breakpoints to " + path));
    }
    return "Breakpoints saved to " + path;
}

Result<size_t> BreakpointRegistry::load(const std::string& path, bool replace) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot open " + path));
    }

    json data = json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        return unexpected(MAKE_ERROR(BREAKPOINT_INVALID, "Invalid JSON in " + path));
    }
    return load_json(data, replace);
}

}  // namespace flowdebug
