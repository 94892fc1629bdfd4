#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "flowdebug/config/configuration.hpp"
#include "flowdebug/core/variable_manager.hpp"
#include "flowdebug/debug/execution_controller.hpp"
#include "flowdebug/debug/flow_runner.hpp"
#include "flowdebug/utils/logging.hpp"
#include "flowdebug/utils/error.hpp"

using namespace flowdebug;
using json = nlohmann::json;

std::atomic<bool> shutdown_requested{false};
std::mutex output_mutex;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

template<typename... Parts>
void print_line(const Parts&... parts) {
    std::lock_guard<std::mutex> lock(output_mutex);
    (std::cout << ... << parts) << std::endl;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <flow-file>\n"
              << "\nOptions:\n"
              << "  -c, --config <file>          Configuration file path\n"
              << "  -m, --mode <mode>            Execution mode (normal, debug, step)\n"
              << "  -b, --break <step>           Add a line breakpoint (repeatable)\n"
              << "  -w, --watch <name>           Watch a variable (repeatable)\n"
              << "  -B, --breakpoints <file>     Load breakpoints from a JSON file\n"
              << "  -S, --save-breakpoints <file> Save breakpoints when the flow ends\n"
              << "  -e, --export-logs <file>     Export the debug log when the flow ends (.json for JSON)\n"
              << "  -l, --log-level <level>      Set log level (trace, debug, info, warn, error)\n"
              << "  -f, --log-file <file>        Log file path\n"
              << "  -h, --help                   Show this help message\n"
              << "\nFlow file:\n"
              << "  [{\"action_id\": \"load\", \"params\": {...}, \"set\": {\"x\": 1}, \"fail\": false}, ...]\n"
              << "  or {\"variables\": {...}, \"steps\": [...]}\n"
              << "\nExamples:\n"
              << "  " << program_name << " flow.json                    # Run in the configured mode\n"
              << "  " << program_name << " -m step flow.json            # Pause before every step\n"
              << "  " << program_name << " -b 2 -w counter flow.json    # Break before step 2, watch counter\n";
}

void print_commands() {
    print_line("Commands:\n"
               "  continue | c              Resume execution\n"
               "  step | s                  Run the next step and pause again\n"
               "  out                       Leave step mode and resume\n"
               "  pause | p                 Pause before the next step\n"
               "  break N [if EXPR]         Add a line or conditional breakpoint\n"
               "  toggle N                  Toggle the line breakpoint at step N\n"
               "  delete ID                 Remove a breakpoint\n"
               "  breakpoints               List breakpoints\n"
               "  cursor N                  Run until step N is about to start\n"
               "  watch NAME | unwatch NAME Manage watch variables\n"
               "  vars                      Show all variables\n"
               "  logs [LEVEL]              Show the debug log\n"
               "  metrics                   Show performance metrics\n"
               "  stop                      Stop the flow\n"
               "  quit | q                  Stop the flow and exit");
}

namespace {

Result<StepIndex> parse_step_index(const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Invalid step index: " + text));
        }
        return static_cast<StepIndex>(value);
    } catch (const std::exception&) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Invalid step index: " + text));
    }
}

// Stores every entry of a "set" object, creating variables on first use
Result<void> assign_variables(VariableManager& variables, const std::map<std::string, Value>& values) {
    for (const auto& [name, value] : values) {
        if (variables.has_variable(name)) {
            RETURN_IF_ERROR(variables.set_variable(name, value));
        } else {
            RETURN_IF_ERROR(variables.create_variable(name, value));
        }
    }
    return {};
}

Result<FlowStep> parse_step(const json& item, size_t position) {
    if (!item.is_object()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
            "Step " + std::to_string(position) + " must be a JSON object"));
    }

    try {
        FlowStep step;
        step.action_id = item.value("action_id", "step_" + std::to_string(position));
        step.enabled = item.value("enabled", true);
        if (item.contains("params")) {
            step.parameters = item.at("params").get<std::map<std::string, Value>>();
        }

        std::map<std::string, Value> assignments;
        if (item.contains("set")) {
            assignments = item.at("set").get<std::map<std::string, Value>>();
        }
        bool fail = item.value("fail", false);
        std::string message = item.value("message", "");

        step.action = [assignments, fail, message](const FlowStep& self, VariableManager& variables)
                -> Result<std::string> {
            RETURN_IF_ERROR(assign_variables(variables, assignments));
            if (fail) {
                return unexpected(MAKE_ERROR(STEP_FAILED,
                    message.empty() ? "Action " + self.action_id + " failed" : message));
            }
            return message.empty() ? "Executed " + self.action_id : message;
        };
        return step;
    } catch (const json::exception& e) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
            "Step " + std::to_string(position) + ": " + e.what()));
    }
}

Result<std::vector<FlowStep>> load_flow(const std::string& path, VariableManager& variables) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot open flow file: " + path));
    }

    json data = json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, "Flow file is not valid JSON: " + path));
    }

    json steps_json = data;
    if (data.is_object()) {
        if (data.contains("variables")) {
            try {
                auto initial = data.at("variables").get<std::map<std::string, Value>>();
                RETURN_IF_ERROR(assign_variables(variables, initial));
            } catch (const json::exception& e) {
                return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
                    std::string("Invalid flow variables: ") + e.what()));
            }
        }
        steps_json = data.value("steps", json::array());
    }
    if (!steps_json.is_array()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, "Flow steps must be a JSON array"));
    }

    std::vector<FlowStep> steps;
    for (size_t i = 0; i < steps_json.size(); ++i) {
        FlowStep step;
        ASSIGN_OR_RETURN(step, parse_step(steps_json[i], i));
        steps.push_back(std::move(step));
    }
    return steps;
}

// Non-blocking line reader over stdin so the loop can notice shutdown and flow completion
class CommandReader {
public:
    // Returns true with a line, false on timeout; sets eof() once stdin is exhausted
    bool read_line(std::string& line, int timeout_ms) {
        if (take_line(line)) {
            return true;
        }
        if (eof_) {
            if (!pending_.empty()) {
                line.swap(pending_);
                pending_.clear();
                return true;
            }
            return false;
        }

        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&fd, 1, timeout_ms);
        if (ready <= 0) {
            return false;
        }

        char buffer[512];
        ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (count <= 0) {
            eof_ = true;
        } else {
            pending_.append(buffer, static_cast<size_t>(count));
        }
        return take_line(line);
    }

    bool eof() const { return eof_ && pending_.empty(); }

private:
    bool take_line(std::string& line) {
        auto newline = pending_.find('\n');
        if (newline == std::string::npos) {
            return false;
        }
        line = pending_.substr(0, newline);
        pending_.erase(0, newline + 1);
        return true;
    }

    std::string pending_;
    bool eof_ = false;
};

// Returns false when the user asked to quit
bool handle_command(const std::string& line, ExecutionController& controller,
                    DebugFlowRunner& runner, const VariableManager& variables) {
    std::istringstream input(line);
    std::string command;
    input >> command;
    if (command.empty()) {
        return true;
    }

    std::string argument;
    input >> argument;

    if (command == "continue" || command == "c") {
        runner.resume();
    } else if (command == "step" || command == "s") {
        runner.step_over();
    } else if (command == "out") {
        runner.step_out();
    } else if (command == "pause" || command == "p") {
        runner.pause();
        print_line("Pause requested");
    } else if (command == "break" || command == "b") {
        auto index = parse_step_index(argument);
        if (!index) {
            print_line(index.error().message());
            return true;
        }
        std::string keyword;
        input >> keyword;
        std::string id;
        if (keyword == "if") {
            std::string expression;
            std::getline(input, expression);
            id = controller.add_breakpoint(Breakpoint::conditional(index.value(), expression));
        } else {
            id = controller.add_breakpoint(Breakpoint::line(index.value()));
        }
        print_line("Breakpoint ", id, " set at step #", index.value());
    } else if (command == "toggle") {
        auto index = parse_step_index(argument);
        if (!index) {
            print_line(index.error().message());
            return true;
        }
        auto [ok, message] = controller.toggle_breakpoint(index.value());
        print_line(ok ? message : "Toggle failed: " + message);
    } else if (command == "delete") {
        print_line(controller.remove_breakpoint(argument) ? "Removed " + argument
                                                          : "No breakpoint " + argument);
    } else if (command == "breakpoints") {
        for (const auto& bp : controller.get_all_breakpoints()) {
            print_line(bp.id, " ", to_string(bp.type), " step=", bp.step_index,
                       bp.enabled ? "" : " (disabled)", " hits=", bp.hit_count,
                       bp.condition.empty() ? "" : " if " + bp.condition);
        }
    } else if (command == "cursor") {
        auto index = parse_step_index(argument);
        if (!index) {
            print_line(index.error().message());
            return true;
        }
        runner.run_to_cursor(index.value());
    } else if (command == "watch") {
        print_line(controller.add_watch_variable(argument) ? "Watching " + argument
                                                           : "Already watching " + argument);
    } else if (command == "unwatch") {
        print_line(controller.remove_watch_variable(argument) ? "Stopped watching " + argument
                                                              : "Not watching " + argument);
    } else if (command == "vars") {
        for (const auto& [name, info] : variables.get_all_variables()) {
            print_line(name, " (", info.scope, ", ", info.type, ") = ", info.value.repr());
        }
    } else if (command == "logs") {
        std::optional<DebugLogLevel> filter;
        if (!argument.empty()) {
            auto level = debug_log_level_from_string(argument);
            if (!level) {
                print_line(level.error().message());
                return true;
            }
            filter = level.value();
        }
        for (const auto& entry : controller.get_debug_logs(filter)) {
            print_line("[", entry.formatted_time(), "] [", to_string(entry.level), "] ", entry.message);
        }
    } else if (command == "metrics") {
        print_line(controller.get_performance_metrics().dump(2));
    } else if (command == "stop") {
        runner.stop();
    } else if (command == "quit" || command == "q") {
        runner.stop();
        return false;
    } else if (command == "help" || command == "h") {
        print_commands();
    } else {
        print_line("Unknown command '", command, "' (type help)");
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_file = "config/flowdebug.json";
    bool config_explicit = false;
    std::string flow_file;
    std::string mode_override;
    std::string log_level;
    std::string log_file;
    std::string breakpoints_file;
    std::string save_breakpoints_file;
    std::string export_logs_file;
    std::vector<std::string> break_steps;
    std::vector<std::string> watch_names;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& target) -> bool {
            if (i + 1 < argc) {
                target = argv[++i];
                return true;
            }
            std::cerr << "Error: Value required after " << arg << std::endl;
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (!next_value(config_file)) return 1;
            config_explicit = true;
        } else if (arg == "-m" || arg == "--mode") {
            if (!next_value(mode_override)) return 1;
        } else if (arg == "-b" || arg == "--break") {
            std::string step;
            if (!next_value(step)) return 1;
            break_steps.push_back(step);
        } else if (arg == "-w" || arg == "--watch") {
            std::string name;
            if (!next_value(name)) return 1;
            watch_names.push_back(name);
        } else if (arg == "-B" || arg == "--breakpoints") {
            if (!next_value(breakpoints_file)) return 1;
        } else if (arg == "-S" || arg == "--save-breakpoints") {
            if (!next_value(save_breakpoints_file)) return 1;
        } else if (arg == "-e" || arg == "--export-logs") {
            if (!next_value(export_logs_file)) return 1;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!next_value(log_level)) return 1;
        } else if (arg == "-f" || arg == "--log-file") {
            if (!next_value(log_file)) return 1;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (flow_file.empty()) {
            flow_file = arg;
        } else {
            std::cerr << "Error: Only one flow file may be given" << std::endl;
            return 1;
        }
    }

    if (flow_file.empty()) {
        std::cerr << "Error: Flow file required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration; a missing default file means defaults
    Configuration config;
    if (config_explicit || std::filesystem::exists(config_file)) {
        auto load_result = config.loadFromFile(config_file);
        if (!load_result) {
            std::cerr << "Failed to load configuration: " << load_result.error().to_string() << std::endl;
            return 1;
        }
    }

    auto logging_config = config.getLoggingConfig();
    if (!log_level.empty()) {
        logging_config.level = log_level;
    }
    if (!log_file.empty()) {
        logging_config.file = log_file;
    }
    config.setLoggingConfig(logging_config);

    std::vector<std::string> config_errors;
    if (!config.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "Configuration error: " << error << std::endl;
        }
        return 1;
    }

    auto log_result = Logger::initialize(Logger::from_string(logging_config.level),
                                         logging_config.file, logging_config.console);
    if (!log_result) {
        std::cerr << "Failed to initialize logger: " << log_result.error().to_string() << std::endl;
        return 1;
    }

    LOG_INFO("flowdebug starting");

    auto debugger_config = config.getDebuggerConfig();
    auto metrics_config = config.getMetricsConfig();

    auto mode = execution_mode_from_string(mode_override.empty() ? debugger_config.default_mode : mode_override);
    if (!mode) {
        LOG_ERROR("{}", mode.error().to_string());
        Logger::shutdown();
        return 1;
    }

    VariableManager variables;
    auto steps = load_flow(flow_file, variables);
    if (!steps) {
        LOG_ERROR("Failed to load flow: {}", steps.error().to_string());
        Logger::shutdown();
        return 1;
    }
    LOG_INFO("Loaded {} steps from {}", steps.value().size(), flow_file);

    ExecutionController::Options options;
    options.max_log_entries = static_cast<size_t>(debugger_config.max_log_entries);
    options.pause_timeout = std::chrono::milliseconds(debugger_config.pause_timeout_ms);
    options.mirror_to_logger = debugger_config.mirror_to_logger;
    options.sample_resources = metrics_config.sample_resources;
    options.export_sample_limit = static_cast<size_t>(metrics_config.export_sample_limit);

    ExecutionController controller(&variables, options);

    if (!breakpoints_file.empty()) {
        auto loaded = controller.load_breakpoints(breakpoints_file);
        if (!loaded) {
            LOG_ERROR("Failed to load breakpoints: {}", loaded.error().to_string());
            Logger::shutdown();
            return 1;
        }
        LOG_INFO("Loaded {} breakpoints from {}", loaded.value(), breakpoints_file);
    }
    for (const auto& text : break_steps) {
        auto index = parse_step_index(text);
        if (!index) {
            LOG_ERROR("{}", index.error().message());
            Logger::shutdown();
            return 1;
        }
        controller.add_breakpoint(Breakpoint::line(index.value()));
    }
    for (const auto& name : watch_names) {
        controller.add_watch_variable(name);
    }

    controller.set_breakpoint_hit_handler([](const std::string& id, StepIndex index, const StepRecord& step) {
        print_line("Breakpoint ", id, " hit at step #", index, " (", step.action_id, ")");
    });
    controller.set_step_execution_handler([](StepIndex index, const StepRecord& step) {
        print_line("Next: step #", index, " (", step.action_id, ")");
    });
    controller.set_execution_paused_handler([](StepIndex index) {
        print_line("Paused at step #", index, ". Type help for commands.");
    });
    controller.set_variable_changed_handler([](const std::string& name, const Value& value) {
        print_line("  watch ", name, " = ", value.repr());
    });

    DebugFlowRunner runner(controller, variables);
    runner.set_step_completed_handler([](StepIndex index, bool success, const std::string& message) {
        print_line(success ? "[ok]   #" : "[fail] #", index, " ", message);
    });
    runner.set_flow_completed_handler([](bool success) {
        print_line("Flow ", success ? "completed successfully" : "failed");
    });

    auto start_result = runner.start(std::move(steps.value()), mode.value());
    if (!start_result) {
        LOG_ERROR("Failed to start flow: {}", start_result.error().to_string());
        Logger::shutdown();
        return 1;
    }

    CommandReader reader;
    bool quit = false;
    while (runner.is_running() && !quit) {
        if (shutdown_requested) {
            LOG_INFO("Shutdown requested");
            runner.stop();
            break;
        }

        std::string line;
        if (reader.read_line(line, 100)) {
            quit = !handle_command(line, controller, runner, variables);
        } else if (reader.eof()) {
            // No more input: let the remaining steps run unattended
            controller.set_execution_mode(ExecutionMode::NORMAL);
            while (runner.is_running() && !shutdown_requested) {
                runner.resume();
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }
    runner.join();

    if (!save_breakpoints_file.empty()) {
        auto saved = controller.save_breakpoints(save_breakpoints_file);
        if (saved) {
            LOG_INFO("{}", saved.value());
        } else {
            LOG_ERROR("Failed to save breakpoints: {}", saved.error().to_string());
        }
    }

    if (!export_logs_file.empty()) {
        bool as_json = std::filesystem::path(export_logs_file).extension() == ".json";
        auto exported = as_json ? controller.export_debug_logs_json(export_logs_file)
                                : controller.export_debug_logs(export_logs_file);
        if (exported) {
            LOG_INFO("{}", exported.value());
        } else {
            LOG_ERROR("Failed to export debug log: {}", exported.error().to_string());
        }
    }

    bool success = runner.last_result().value_or(false);
    LOG_INFO("flowdebug finished ({})", success ? "success" : "failure");
    Logger::shutdown();
    return success ? 0 : 1;
}
