// Keylight CLI
// Discovers lights and applies one control operation

#include <filesystem>
#include <iostream>
#include <string>

#include "control/light_controller.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/session.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: keylight-cli [OPTIONS] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  discover           List discovered lights\n";
    std::cerr << "  toggle             Turn lights on/off\n";
    std::cerr << "  brightness-up      Increase brightness by 5%\n";
    std::cerr << "  brightness-down    Decrease brightness by 5%\n";
    std::cerr << "  temperature-up     Make light warmer\n";
    std::cerr << "  temperature-down   Make light colder\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH      Path to config file (default: keylight.yaml, optional)\n";
    std::cerr << "  --help, -h         Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = "keylight.yaml";
    bool explicit_config = false;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
            explicit_config = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (command.empty() && arg.substr(0, 2) != "--") {
            command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto operation = keylight::control::parse_operation(command);
    if (!operation && command != "discover") {
        std::cerr << "Unknown command: " << command << "\n";
        return 1;
    }

    keylight::runtime::KeylightConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        if (!keylight::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " + error);
            return 1;
        }
    } else if (explicit_config) {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }

    if (!keylight::runtime::apply_environment(config, error) || !keylight::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " + error);
        return 1;
    }

    keylight::logging::Logger::set_level(keylight::logging::string_to_level(config.logging.level));

    keylight::runtime::Session session(config);

    if (!operation) {
        auto result = session.discover();
        if (!result.success) {
            LOG_DEBUG("Discovery failed: " << keylight::error_code_to_string(result.code));
            std::cerr << result.error_message << "\n";
            return 1;
        }
        for (const auto &endpoint : result.endpoints) {
            std::cout << endpoint.to_string() << "\n";
        }
        return 0;
    }

    auto result = session.discover_and_execute(*operation);
    if (!result.success) {
        LOG_DEBUG(keylight::control::operation_to_string(*operation)
                  << " failed: " << keylight::error_code_to_string(result.code));
        std::cerr << result.error_message << "\n";
        return 1;
    }

    std::cout << keylight::control::describe_result(result) << "\n";
    return 0;
}
