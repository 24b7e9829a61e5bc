#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "flowgate/cli/commands.hpp"
#include "flowgate/core/config.hpp"
#include "flowgate/core/error.hpp"

namespace flowgate::cli {

/// The `flowgate` command line.
///
/// Subcommands are registered up front but run only after parsing, once the
/// configuration (file or environment, then FLOWGATE_LOG_LEVEL, then
/// --log-level) has been loaded and validated. Exit codes: 0 success, 1 a
/// policy or scenario failed to load, 2 usage or configuration error.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    auto run(int argc, char** argv) -> int;

private:
    void setup_commands();
    auto load_configuration() -> VoidResult;

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::vector<Command> commands_;
};

} // namespace flowgate::cli
