#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace cronlet::cli {

/// Options shared by every subcommand. Filled by CLI11 before any
/// subcommand callback runs.
struct GlobalOptions {
    std::string config_path;
    std::string log_level = "info";
};

/// Register the `check` subcommand.
/// Validates an expression and prints each field's permitted values.
void register_check_command(CLI::App& app, GlobalOptions& options);

/// Register the `next` subcommand.
/// Prints the next run times of an expression.
void register_next_command(CLI::App& app, GlobalOptions& options);

/// Register the `match` subcommand.
/// Tells whether a local time satisfies an expression.
void register_match_command(CLI::App& app, GlobalOptions& options);

/// Register the `run` subcommand.
/// Runs the jobs of the configuration file until interrupted.
void register_run_command(CLI::App& app, GlobalOptions& options);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace cronlet::cli
