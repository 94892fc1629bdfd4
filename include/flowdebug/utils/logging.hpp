#pragma once

#include "flowdebug/utils/types.hpp"
#include "flowdebug/utils/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace flowdebug {

enum class LogLevel {
    TRACE = 0,
    DEBUG_LEVEL = 1,
    INFO = 2,
    WARN = 3,
    ERROR_LEVEL = 4
};

class Logger {
public:
    static Result<void> initialize(LogLevel level = LogLevel::INFO,
                                   const std::string& log_file = "",
                                   bool enable_console = true);

    static void shutdown();
    static bool is_initialized() { return initialized_; }

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name = "main");

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static LogLevel from_string(const std::string& level_str);

    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->trace(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->debug(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->info(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->warn(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->error(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        if (auto logger = get_logger()) {
            logger->critical(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
    static LogLevel from_spdlog_level(spdlog::level::level_enum level);

    static bool initialized_;
    static LogLevel current_level_;
};

// Convenience macros for logging
#define LOG_TRACE(...) ::flowdebug::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::flowdebug::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...) ::flowdebug::Logger::info(__VA_ARGS__)
#define LOG_WARN(...) ::flowdebug::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::flowdebug::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::flowdebug::Logger::critical(__VA_ARGS__)

// Component-specific loggers
class ComponentLogger {
public:
    explicit ComponentLogger(const std::string& component_name)
        : component_name_(component_name) {}

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) const {
        if (auto logger = Logger::get_logger()) {
            logger->trace(fmt::runtime("[{}] " + format), component_name_, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) const {
        if (auto logger = Logger::get_logger()) {
            logger->debug(fmt::runtime("[{}] " + format), component_name_, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) const {
        if (auto logger = Logger::get_logger()) {
            logger->info(fmt::runtime("[{}] " + format), component_name_, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) const {
        if (auto logger = Logger::get_logger()) {
            logger->warn(fmt::runtime("[{}] " + format), component_name_, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) const {
        if (auto logger = Logger::get_logger()) {
            logger->error(fmt::runtime("[{}] " + format), component_name_, std::forward<Args>(args)...);
        }
    }

    const std::string& name() const { return component_name_; }

private:
    std::string component_name_;
};

#define DECLARE_LOGGER(name) \
    static const ::flowdebug::ComponentLogger component_logger_{name}

#define COMPONENT_LOG_TRACE(...) component_logger_.trace(__VA_ARGS__)
#define COMPONENT_LOG_DEBUG(...) component_logger_.debug(__VA_ARGS__)
#define COMPONENT_LOG_INFO(...) component_logger_.info(__VA_ARGS__)
#define COMPONENT_LOG_WARN(...) component_logger_.warn(__VA_ARGS__)
#define COMPONENT_LOG_ERROR(...) component_logger_.error(__VA_ARGS__)

}  // namespace flowdebug
