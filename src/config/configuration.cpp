#include "flowdebug/config/configuration.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace flowdebug {

using json = nlohmann::json;

namespace {

bool is_known_mode(const std::string& mode) {
    return mode == "normal" || mode == "debug" || mode == "step";
}

bool is_known_log_level(const std::string& level) {
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "warning", "error"};
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(levels.begin(), levels.end(), lower) != levels.end();
}

}  // namespace

Configuration::Configuration() {
    setDefaults();
}

Configuration::~Configuration() = default;

Result<void> Configuration::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        return unexpected(MAKE_ERROR(CONFIG_FILE_NOT_FOUND, "Configuration file not found: " + filename));
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(IO_READ_FAILED, "Cannot open configuration file: " + filename));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadFromString(content);
}

Result<void> Configuration::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, "Cannot open " + filename + " for writing"));
    }

    file << saveToString();
    if (!file) {
        return unexpected(MAKE_ERROR(IO_WRITE_FAILED, "Failed writing configuration to " + filename));
    }
    return {};
}

Result<void> Configuration::loadFromString(const std::string& config_data) {
    json config_json = json::parse(config_data, nullptr, false);
    if (config_json.is_discarded()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, "Configuration is not valid JSON"));
    }
    if (!config_json.is_object()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, "Configuration root must be a JSON object"));
    }

    // Parse into a copy so a bad file leaves the current tree untouched
    ConfigTree tree = config_tree_;
    for (const auto& [section_name, section] : config_json.items()) {
        if (!section.is_object()) {
            return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
                "Section '" + section_name + "' must be a JSON object"));
        }

        for (const auto& [key, value] : section.items()) {
            auto& slot = tree[section_name][key];
            if (value.is_boolean()) {
                slot = value.get<bool>();
            } else if (value.is_number_integer()) {
                slot = value.get<int64_t>();
            } else if (value.is_number_float()) {
                slot = value.get<double>();
            } else if (value.is_string()) {
                slot = value.get<std::string>();
            } else {
                return unexpected(MAKE_ERROR(CONFIG_INVALID_VALUE,
                    "Value of " + section_name + "." + key + " must be a bool, number or string"));
            }
        }
    }

    config_tree_ = std::move(tree);
    return {};
}

std::string Configuration::saveToString() const {
    json config = json::object();

    for (const auto& [section_name, section] : config_tree_) {
        json section_json = json::object();
        for (const auto& [key, value] : section) {
            std::visit([&section_json, &key = key](const auto& arg) { section_json[key] = arg; }, value);
        }
        config[section_name] = std::move(section_json);
    }

    return config.dump(2);
}

bool Configuration::hasSection(const std::string& section) const {
    return config_tree_.find(section) != config_tree_.end();
}

bool Configuration::hasKey(const std::string& section, const std::string& key) const {
    auto section_it = config_tree_.find(section);
    if (section_it == config_tree_.end()) {
        return false;
    }
    return section_it->second.find(key) != section_it->second.end();
}

Configuration::ConfigSection Configuration::getSection(const std::string& section) const {
    auto section_it = config_tree_.find(section);
    if (section_it != config_tree_.end()) {
        return section_it->second;
    }
    return ConfigSection{};
}

void Configuration::setSection(const std::string& section, const ConfigSection& values) {
    config_tree_[section] = values;
}

void Configuration::removeSection(const std::string& section) {
    config_tree_.erase(section);
}

std::vector<std::string> Configuration::getSectionNames() const {
    std::vector<std::string> names;
    names.reserve(config_tree_.size());
    for (const auto& pair : config_tree_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Configuration::validate(std::vector<std::string>& errors) const {
    errors.clear();

    auto debugger = getDebuggerConfig();
    if (!is_known_mode(debugger.default_mode)) {
        errors.push_back("debugger.default_mode must be one of normal, debug, step (got '" +
                         debugger.default_mode + "')");
    }
    if (debugger.max_log_entries < 1) {
        errors.push_back("debugger.max_log_entries must be at least 1");
    }
    if (debugger.pause_timeout_ms < 0) {
        errors.push_back("debugger.pause_timeout_ms must not be negative");
    }

    auto metrics = getMetricsConfig();
    if (metrics.export_sample_limit < 1) {
        errors.push_back("metrics.export_sample_limit must be at least 1");
    }

    auto logging = getLoggingConfig();
    if (!is_known_log_level(logging.level)) {
        errors.push_back("logging.level must be one of trace, debug, info, warn, error (got '" +
                         logging.level + "')");
    }
    if (!logging.console && logging.file.empty()) {
        errors.push_back("logging needs console output or a log file");
    }

    return errors.empty();
}

void Configuration::setDefaults() {
    config_tree_.clear();
    setDebuggerConfig(DebuggerConfig{});
    setMetricsConfig(MetricsConfig{});
    setLoggingConfig(LoggingConfig{});
}

Configuration::DebuggerConfig Configuration::getDebuggerConfig() const {
    DebuggerConfig config;
    config.default_mode = getValue<std::string>("debugger", "default_mode", config.default_mode);
    config.max_log_entries = getValue<int64_t>("debugger", "max_log_entries", config.max_log_entries);
    config.pause_timeout_ms = getValue<int64_t>("debugger", "pause_timeout_ms", config.pause_timeout_ms);
    config.mirror_to_logger = getValue<bool>("debugger", "mirror_to_logger", config.mirror_to_logger);
    return config;
}

Configuration::MetricsConfig Configuration::getMetricsConfig() const {
    MetricsConfig config;
    config.sample_resources = getValue<bool>("metrics", "sample_resources", config.sample_resources);
    config.export_sample_limit = getValue<int64_t>("metrics", "export_sample_limit", config.export_sample_limit);
    return config;
}

Configuration::LoggingConfig Configuration::getLoggingConfig() const {
    LoggingConfig config;
    config.level = getValue<std::string>("logging", "level", config.level);
    config.file = getValue<std::string>("logging", "file", config.file);
    config.console = getValue<bool>("logging", "console", config.console);
    return config;
}

void Configuration::setDebuggerConfig(const DebuggerConfig& config) {
    setValue("debugger", "default_mode", config.default_mode);
    setValue("debugger", "max_log_entries", config.max_log_entries);
    setValue("debugger", "pause_timeout_ms", config.pause_timeout_ms);
    setValue("debugger", "mirror_to_logger", config.mirror_to_logger);
}

void Configuration::setMetricsConfig(const MetricsConfig& config) {
    setValue("metrics", "sample_resources", config.sample_resources);
    setValue("metrics", "export_sample_limit", config.export_sample_limit);
}

void Configuration::setLoggingConfig(const LoggingConfig& config) {
    setValue("logging", "level", config.level);
    setValue("logging", "file", config.file);
    setValue("logging", "console", config.console);
}

// Template method specializations
template<>
std::string Configuration::convertValue<std::string>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else {
            return std::to_string(arg);
        }
    }, value);
}

template<>
bool Configuration::convertValue<bool>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string lower = arg;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
        } else {
            return arg != 0;
        }
    }, value);
}

template<>
int64_t Configuration::convertValue<int64_t>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> int64_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int64_t>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            return static_cast<int64_t>(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? 1 : 0;
        } else {
            int64_t parsed = 0;
            auto first = arg.data();
            auto last = arg.data() + arg.size();
            auto [ptr, ec] = std::from_chars(first, last, parsed);
            return (ec == std::errc() && ptr == last) ? parsed : 0;
        }
    }, value);
}

template<>
double Configuration::convertValue<double>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> double {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, double>) {
            return arg;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return static_cast<double>(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? 1.0 : 0.0;
        } else {
            char* end = nullptr;
            double parsed = std::strtod(arg.c_str(), &end);
            return (end && *end == '\0' && !arg.empty()) ? parsed : 0.0;
        }
    }, value);
}

}  // namespace flowdebug
