#include "cronlet/cli/commands.hpp"
#include "cronlet/core/config.hpp"
#include "cronlet/core/logger.hpp"
#include "cronlet/core/utils.hpp"
#include "cronlet/cron/job.hpp"
#include "cronlet/cron/matcher.hpp"
#include "cronlet/cron/parser.hpp"
#include "cronlet/cron/scheduler.hpp"
#include "cronlet/cron/search.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef CRONLET_VERSION_STRING
#define CRONLET_VERSION_STRING "0.1.0-dev"
#endif

namespace cronlet::cli {

namespace {

/// Parse an expression for a command, exiting with status 1 on failure.
auto parse_or_exit(const std::string& expression) -> cron::ParsedSchedule {
    auto parsed = cron::parse_schedule(expression);
    if (!parsed) {
        std::cerr << "error [" << error_code_to_string(parsed.error().code()) << "]: "
                  << parsed.error().what() << "\n";
        throw CLI::RuntimeError(1);
    }
    return std::move(*parsed);
}

auto parse_time_or_exit(const std::string& text) -> Timestamp {
    auto parsed = utils::parse_local_time(text);
    if (!parsed) {
        std::cerr << "error: " << parsed.error().what() << "\n";
        throw CLI::RuntimeError(1);
    }
    return *parsed;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("check", "Validate an expression and show its fields");

    auto expression = std::make_shared<std::string>();
    sub->add_option("expression", *expression, "Alias or 5/6-field cron expression")
        ->required();

    sub->callback([&options, expression]() {
        Logger::init("cronlet", options.log_level);

        auto schedule = parse_or_exit(*expression);
        if (auto alias = cron::expand_alias(*expression)) {
            std::cout << *expression << " = " << *alias << "\n";
        }
        std::cout << schedule.describe();
    });
}

// ---------------------------------------------------------------------------
// next command
// ---------------------------------------------------------------------------

void register_next_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("next", "Print the next run times of an expression");

    struct NextArgs {
        std::string expression;
        int count = 1;
        std::string from;
    };
    auto args = std::make_shared<NextArgs>();

    sub->add_option("expression", args->expression, "Alias or 5/6-field cron expression")
        ->required();
    sub->add_option("-n,--count", args->count, "Number of run times to print")
        ->check(CLI::Range(1, 1000));
    sub->add_option("--from", args->from,
                    "Local start time 'YYYY-MM-DD HH:MM[:SS]' (default: now)");

    sub->callback([&options, args]() {
        Logger::init("cronlet", options.log_level);

        auto schedule = parse_or_exit(args->expression);
        Timestamp from = args->from.empty() ? Clock::now() : parse_time_or_exit(args->from);

        for (int i = 0; i < args->count; ++i) {
            auto next = cron::next_run(schedule, from);
            if (!next) {
                std::cout << "no run within 366 days of "
                          << utils::format_local_time(from) << "\n";
                return;
            }
            std::cout << utils::format_local_time(*next) << "\n";
            from = *next;
        }
    });
}

// ---------------------------------------------------------------------------
// match command
// ---------------------------------------------------------------------------

void register_match_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("match", "Check whether a local time matches an expression");

    struct MatchArgs {
        std::string expression;
        std::string time;
    };
    auto args = std::make_shared<MatchArgs>();

    sub->add_option("expression", args->expression, "Alias or 5/6-field cron expression")
        ->required();
    sub->add_option("time", args->time, "Local time 'YYYY-MM-DD HH:MM[:SS]'")
        ->required();

    sub->callback([&options, args]() {
        Logger::init("cronlet", options.log_level);

        auto schedule = parse_or_exit(args->expression);
        auto when = parse_time_or_exit(args->time);

        if (cron::matches(schedule, when)) {
            std::cout << "yes\n";
            return;
        }
        std::cout << "no\n";
        throw CLI::RuntimeError(2);
    });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("run", "Run the configured jobs until interrupted");

    sub->callback([&app, &options]() {
        Config config = options.config_path.empty()
            ? load_config_from_env()
            : load_config(std::filesystem::path(options.config_path));

        // An explicit --log-level wins over the file.
        if (app.get_option("--log-level")->count() > 0) {
            config.log_level = options.log_level;
        }
        Logger::init("cronlet", config.log_level);

        boost::asio::io_context ioc;
        cron::CronScheduler scheduler(ioc, cron::CronJob::Options{
            .retry_delay = std::chrono::milliseconds(config.retry_delay_ms),
        });

        size_t failed = 0;
        for (const auto& job : config.jobs) {
            if (!job.enabled) {
                LOG_INFO("Skipping disabled job '{}'", job.name);
                continue;
            }
            auto added = scheduler.add(job.name, job.schedule,
                [name = job.name, message = job.message]() {
                    LOG_INFO("[{}] {}", name, message.empty() ? "fired" : message);
                });
            if (!added) {
                LOG_ERROR("Cannot register job '{}': {}", job.name, added.error().what());
                ++failed;
            }
        }

        if (scheduler.size() == 0) {
            LOG_ERROR("No runnable jobs configured");
            throw CLI::RuntimeError(1);
        }

        // Set up signal handling.
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &scheduler](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", sig);
                scheduler.stop_all();
                ioc.stop();
            }
        });

        scheduler.start_all();
        for (const auto& name : scheduler.names()) {
            if (auto next = scheduler.get(name)->next_run()) {
                LOG_INFO("Job '{}' next run at {}", name, utils::format_local_time(*next));
            }
        }
        LOG_INFO("Running {} job(s) ({} rejected)", scheduler.size(), failed);

        ioc.run();
        LOG_INFO("Shutdown complete");
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "cronlet " << CRONLET_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace cronlet::cli
