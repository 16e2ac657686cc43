#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "cronlet/cli/commands.hpp"

namespace cronlet::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (check, next, match, run, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto options() const -> const GlobalOptions&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    GlobalOptions options_;
};

} // namespace cronlet::cli
