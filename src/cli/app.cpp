#include "flowgate/cli/app.hpp"
#include "flowgate/core/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifndef FLOWGATE_VERSION_STRING
#define FLOWGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace flowgate::cli {

App::App()
    : cli_("flowgate", "Information-flow policy engine for agent tool calls")
{
    cli_.set_version_flag("--version", FLOWGATE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("FLOWGATE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (auto loaded = load_configuration(); !loaded) {
        std::cerr << "error: " << loaded.error().what() << "\n";
        return 2;
    }

    for (const auto& command : commands_) {
        if (command.sub->parsed()) {
            auto code = command.run();
            Logger::flush();
            return code;
        }
    }
    return 0;
}

auto App::load_configuration() -> VoidResult {
    Logger::init("flowgate", log_level_.empty() ? "warn" : log_level_);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    } else {
        config_ = load_config_from_env();
    }

    // Environment beats the file; the command line beats both.
    if (auto* val = std::getenv("FLOWGATE_LOG_LEVEL")) config_.log_level = val;
    if (!log_level_.empty()) config_.log_level = log_level_;

    if (auto valid = validate_config(config_); !valid) return valid;
    Logger::set_level(config_.log_level);
    return {};
}

void App::setup_commands() {
    commands_.push_back(register_check_command(cli_, config_));
    commands_.push_back(register_evaluate_command(cli_, config_));
    commands_.push_back(register_version_command(cli_));
}

} // namespace flowgate::cli
