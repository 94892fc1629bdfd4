#pragma once

#include "flowdebug/debug/debug_types.hpp"
#include "flowdebug/utils/error.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flowdebug {

struct DebugLogEntry {
    WallTime timestamp;
    DebugLogLevel level = DebugLogLevel::INFO;
    std::string message;

    // "YYYY-mm-dd HH:MM:SS" in local time
    std::string formatted_time() const;
};

/**
 * @brief Bounded, timestamped log of debugger events
 *
 * Holds at most max_entries entries; adding beyond that evicts the oldest.
 * Entries are optionally mirrored to the process logger. Exports never
 * throw: I/O failures come back as FILE_ERROR.
 */
class DebugLogBuffer {
public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit DebugLogBuffer(size_t max_entries = kDefaultMaxEntries, bool mirror_to_logger = true);

    void add(DebugLogLevel level, const std::string& message);

    std::vector<DebugLogEntry> get_logs(std::optional<DebugLogLevel> filter_level = std::nullopt) const;
    void clear();

    size_t size() const;
    size_t max_entries() const { return max_entries_; }
    void set_max_entries(size_t max_entries);
    void set_mirror_to_logger(bool mirror) { mirror_to_logger_ = mirror; }

    Result<std::string> export_text(const std::string& path) const;
    Result<std::string> export_json(const std::string& path) const;

private:
    void trim_locked();

    std::deque<DebugLogEntry> entries_;
    size_t max_entries_;
    std::atomic<bool> mirror_to_logger_;
    mutable std::mutex entries_mutex_;
};

}  // namespace flowdebug
