#pragma once

#include "flowdebug/utils/error.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace flowdebug {

/**
 * @brief Sectioned configuration for the debugger and its host process
 *
 * Supports:
 * - JSON configuration files
 * - Typed views per section
 * - Range and name validation
 */
class Configuration {
public:
    using ConfigValue = std::variant<bool, int64_t, double, std::string>;
    using ConfigSection = std::unordered_map<std::string, ConfigValue>;
    using ConfigTree = std::unordered_map<std::string, ConfigSection>;

    Configuration();
    ~Configuration();

    // File operations; loading overlays the file on top of the defaults
    Result<void> loadFromFile(const std::string& filename);
    Result<void> saveToFile(const std::string& filename) const;
    Result<void> loadFromString(const std::string& config_data);
    std::string saveToString() const;

    // Value access
    template<typename T>
    T getValue(const std::string& section, const std::string& key, const T& default_value = T{}) const;

    template<typename T>
    void setValue(const std::string& section, const std::string& key, const T& value);

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // Section management
    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& values);
    void removeSection(const std::string& section);
    std::vector<std::string> getSectionNames() const;

    bool validate(std::vector<std::string>& errors) const;

    void setDefaults();

    struct DebuggerConfig {
        std::string default_mode = "debug";
        int64_t max_log_entries = 1000;
        int64_t pause_timeout_ms = 0;  // 0 waits forever
        bool mirror_to_logger = true;
    };

    struct MetricsConfig {
        bool sample_resources = true;
        int64_t export_sample_limit = 100;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file = "";
        bool console = true;
    };

    // Typed configuration accessors
    DebuggerConfig getDebuggerConfig() const;
    MetricsConfig getMetricsConfig() const;
    LoggingConfig getLoggingConfig() const;

    void setDebuggerConfig(const DebuggerConfig& config);
    void setMetricsConfig(const MetricsConfig& config);
    void setLoggingConfig(const LoggingConfig& config);

private:
    ConfigTree config_tree_;

    template<typename T>
    T convertValue(const ConfigValue& value) const;
};

template<>
std::string Configuration::convertValue<std::string>(const ConfigValue& value) const;
template<>
bool Configuration::convertValue<bool>(const ConfigValue& value) const;
template<>
int64_t Configuration::convertValue<int64_t>(const ConfigValue& value) const;
template<>
double Configuration::convertValue<double>(const ConfigValue& value) const;

// Template implementations
template<typename T>
T Configuration::getValue(const std::string& section, const std::string& key, const T& default_value) const {
    auto section_it = config_tree_.find(section);
    if (section_it == config_tree_.end()) {
        return default_value;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }

    return convertValue<T>(key_it->second);
}

template<typename T>
void Configuration::setValue(const std::string& section, const std::string& key, const T& value) {
    config_tree_[section][key] = value;
}

}  // namespace flowdebug
