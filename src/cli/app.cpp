#include "cronlet/cli/app.hpp"
#include "cronlet/core/logger.hpp"

// Version string; typically injected by CMake via -DCRONLET_VERSION_STRING=...
#ifndef CRONLET_VERSION_STRING
#define CRONLET_VERSION_STRING "0.1.0-dev"
#endif

namespace cronlet::cli {

App::App()
    : cli_("cronlet", "Cron expression checker and job runner")
{
    cli_.set_version_flag("--version", CRONLET_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CRONLET_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("CRONLET_LOG_LEVEL")
        ->default_val("info");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        Logger::flush();
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already been invoked by
    // CLI11's parse().
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_check_command(cli_, options_);
    register_next_command(cli_, options_);
    register_match_command(cli_, options_);
    register_run_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace cronlet::cli
