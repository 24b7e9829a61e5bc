#include "flowgate/cli/commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "flowgate/audit/audit.hpp"
#include "flowgate/cli/scenario.hpp"
#include "flowgate/core/logger.hpp"
#include "flowgate/policy/loader.hpp"
#include "flowgate/policy/rule_table.hpp"

// Version string; typically injected by CMake via -DFLOWGATE_VERSION_STRING=...
#ifndef FLOWGATE_VERSION_STRING
#define FLOWGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace flowgate::cli {

namespace {

/// Loads and compiles a policy, reporting failures on stderr.
auto load_rules(const std::string& path)
    -> std::optional<std::pair<policy::PolicyLoadOutcome, std::shared_ptr<const policy::RuleTable>>> {
    auto outcome = policy::load_policy(path);
    if (!outcome) {
        std::cerr << "error: " << outcome.error().what() << "\n";
        return std::nullopt;
    }
    auto table = policy::RuleTable::compile(outcome->policy);
    if (!table) {
        std::cerr << "error: " << table.error().what() << "\n";
        return std::nullopt;
    }
    return std::make_pair(std::move(*outcome),
                          std::make_shared<const policy::RuleTable>(std::move(*table)));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

auto register_check_command(CLI::App& app, const Config& config) -> Command {
    auto* sub = app.add_subcommand("check", "Validate a policy document and print a summary");

    auto policy_path = std::make_shared<std::string>();
    sub->add_option("policy", *policy_path, "Policy file (JSON); defaults to policy_path")
        ->check(CLI::ExistingFile);

    return Command{sub, [&config, policy_path]() -> int {
        auto path = !policy_path->empty() ? *policy_path : config.policy_path.value_or("");
        if (path.empty()) {
            std::cerr << "error: no policy given and no policy_path configured\n";
            return 2;
        }

        auto loaded = load_rules(path);
        if (!loaded) return 1;
        const auto& [outcome, table] = *loaded;

        json malformed = json::array();
        for (const auto* bad : table->malformed()) {
            malformed.push_back(json{{"tool", bad->tool}, {"problem", bad->problem}});
        }

        json summary = {
            {"policy_name", outcome.policy.policy_name},
            {"schema_version", outcome.policy.schema_version},
            {"policy_hash", policy::policy_hash(outcome.policy)},
            {"default_action", outcome.policy.default_action},
            {"strict_mode", outcome.policy.strict_mode},
            {"budgets", outcome.policy.budgets},
            {"tools", table->size()},
            {"malformed", std::move(malformed)},
            {"migration", outcome.migration_audit},
        };
        std::cout << summary.dump(2) << "\n";
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// evaluate command
// ---------------------------------------------------------------------------

auto register_evaluate_command(CLI::App& app, const Config& config) -> Command {
    auto* sub = app.add_subcommand("evaluate", "Replay a scenario against a policy");

    struct Options {
        std::string policy;
        std::string scenario;
    };
    auto opts = std::make_shared<Options>();
    sub->add_option("-p,--policy", opts->policy, "Policy file (JSON); defaults to policy_path")
        ->check(CLI::ExistingFile);
    sub->add_option("-s,--scenario", opts->scenario, "Scenario file (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    return Command{sub, [&config, opts]() -> int {
        auto path = !opts->policy.empty() ? opts->policy : config.policy_path.value_or("");
        if (path.empty()) {
            std::cerr << "error: no policy given and no policy_path configured\n";
            return 2;
        }

        auto loaded = load_rules(path);
        if (!loaded) return 1;

        json scenario;
        try {
            std::ifstream in(opts->scenario);
            scenario = json::parse(in);
        } catch (const json::exception& e) {
            std::cerr << "error: cannot parse scenario " << opts->scenario << ": " << e.what()
                      << "\n";
            return 1;
        }

        audit::LogAuditSink log_sink;
        ScenarioOptions options;
        options.engine.witness_on_allow = config.engine.witness_on_allow;
        options.engine.include_witness_in_audit = config.audit.include_witness;
        options.sink = config.audit.enabled ? &log_sink : nullptr;
        if (config.snapshot.dir) options.snapshot_dir = *config.snapshot.dir;
        options.verify_digest = config.snapshot.verify_digest;

        ScenarioRunner runner(loaded->second, options);
        auto lines = runner.run(scenario);
        if (!lines) {
            std::cerr << "error: " << lines.error().what() << "\n";
            return 1;
        }
        for (const auto& line : *lines) {
            std::cout << line.dump() << "\n";
        }
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");
    return Command{sub, []() -> int {
        std::cout << "flowgate " << FLOWGATE_VERSION_STRING << "\n";
        return 0;
    }};
}

} // namespace flowgate::cli
