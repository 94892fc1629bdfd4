#include "flowdebug/config/configuration.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace flowdebug;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> <config-file>\n";
    std::cout << "\nCommands:\n";
    std::cout << "  validate <file>   Load and validate a configuration file\n";
    std::cout << "  show <file>       Print the effective configuration (file merged over defaults)\n";
    std::cout << "  defaults <file>   Write the default configuration to a file\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " validate config/flowdebug.json\n";
    std::cout << "  " << program_name << " defaults config/flowdebug.json\n";
}

int load_and_validate(Configuration& config, const std::string& path) {
    auto result = config.loadFromFile(path);
    if (!result) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return 1;
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "Invalid: " << error << "\n";
        }
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "flowdebug - Configuration Tool\n";
    std::cout << "Version 1.0.0\n\n";

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string path = argv[2];
    Configuration config;

    if (command == "validate") {
        std::cout << "Loading configuration from: " << path << "\n";
        int status = load_and_validate(config, path);
        if (status == 0) {
            std::cout << "Configuration is valid (sections:";
            for (const auto& name : config.getSectionNames()) {
                std::cout << " " << name;
            }
            std::cout << ")\n";
        }
        return status;
    }

    if (command == "show") {
        int status = load_and_validate(config, path);
        if (status == 1) {
            return status;
        }
        std::cout << config.saveToString() << "\n";
        return status;
    }

    if (command == "defaults") {
        auto result = config.saveToFile(path);
        if (!result) {
            std::cerr << "Error: " << result.error().to_string() << "\n";
            return 1;
        }
        std::cout << "Default configuration written to " << path << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
