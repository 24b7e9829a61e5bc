#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "flowgate/core/config.hpp"

namespace flowgate::cli {

/// A registered subcommand and the action to run once it is selected and
/// the configuration has been loaded. Returns the process exit code.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int()> run;
};

/// Register the `check` subcommand.
/// Loads a policy, migrating legacy schemas, and prints a summary.
auto register_check_command(CLI::App& app, const Config& config) -> Command;

/// Register the `evaluate` subcommand.
/// Replays a scenario against a policy and prints one JSON line per event.
auto register_evaluate_command(CLI::App& app, const Config& config) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> Command;

} // namespace flowgate::cli
