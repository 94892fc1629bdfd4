#include "flowdebug/debug/debug_log.hpp"
#include "flowdebug/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace flowdebug {

using json = nlohmann::json;

DECLARE_LOGGER("DebugLog");

namespace {

Result<std::ofstream> open_for_export(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected(MAKE_ERROR(FILE_ERROR,
                "Cannot create directory " + parent.string() + ": " + ec.message()));
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot open " + path + " for writing"));
    }
    return file;
}

void mirror(DebugLogLevel level, const std::string& message) {
    switch (level) {
        case DebugLogLevel::DEBUG: COMPONENT_LOG_DEBUG("{}", message); break;
        case DebugLogLevel::INFO:
        case DebugLogLevel::SUCCESS: COMPONENT_LOG_INFO("{}", message); break;
        case DebugLogLevel::WARNING: COMPONENT_LOG_WARN("{}", message); break;
        case DebugLogLevel::ERROR: COMPONENT_LOG_ERROR("{}", message); break;
    }
}

}  // namespace

std::string DebugLogEntry::formatted_time() const {
    auto time_t = SystemClock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

DebugLogBuffer::DebugLogBuffer(size_t max_entries, bool mirror_to_logger)
    : max_entries_(max_entries == 0 ? 1 : max_entries), mirror_to_logger_(mirror_to_logger) {}

void DebugLogBuffer::add(DebugLogLevel level, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        entries_.push_back(DebugLogEntry{SystemClock::now(), level, message});
        trim_locked();
    }

    if (mirror_to_logger_) {
        mirror(level, message);
    }
}

std::vector<DebugLogEntry> DebugLogBuffer::get_logs(std::optional<DebugLogLevel> filter_level) const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    std::vector<DebugLogEntry> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!filter_level || entry.level == *filter_level) {
            result.push_back(entry);
        }
    }
    return result;
}

void DebugLogBuffer::clear() {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    entries_.clear();
}

size_t DebugLogBuffer::size() const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    return entries_.size();
}

void DebugLogBuffer::set_max_entries(size_t max_entries) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    max_entries_ = max_entries == 0 ? 1 : max_entries;
    trim_locked();
}

void DebugLogBuffer::trim_locked() {
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

Result<std::string> DebugLogBuffer::export_text(const std::string& path) const {
    auto entries = get_logs();

    auto file = open_for_export(path);
    if (!file) {
        return unexpected(file.error());
    }

    for (const auto& entry : entries) {
        file.value() << "[" << entry.formatted_time() << "] [" << to_string(entry.level) << "] "
                     << entry.message << "\n";
    }
    file.value().flush();
    if (!file.value()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Failed writing debug log to " + path));
    }
    return "Exported " + std::to_string(entries.size()) + " log entries to " + path;
}

Result<std::string> DebugLogBuffer::export_json(const std::string& path) const {
    auto entries = get_logs();

    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back(json{
            {"timestamp", to_epoch_seconds(entry.timestamp)},
            {"level", to_string(entry.level)},
            {"message", entry.message},
            {"formatted_time", entry.formatted_time()}
        });
    }

    auto file = open_for_export(path);
    if (!file) {
        return unexpected(file.error());
    }

    // Invalid UTF-8 in messages is replaced rather than thrown on
    file.value() << array.dump(2, ' ', false, json::error_handler_t::replace);
    file.value().flush();
    if (!file.value()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Failed writing debug log to " + path));
    }
    return "Exported " + std::to_string(entries.size()) + " log entries to " + path;
}

}  // namespace flowdebug
