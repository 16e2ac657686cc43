#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "cronlet/core/error.hpp"
#include "cronlet/core/types.hpp"
#include "cronlet/cron/delayed_task.hpp"
#include "cronlet/cron/schedule.hpp"

namespace cronlet::cron {

using boost::asio::awaitable;

enum class JobStatus {
    Idle,
    Running,
    Paused,
};

inline auto to_string(JobStatus status) -> std::string_view {
    switch (status) {
        case JobStatus::Idle: return "idle";
        case JobStatus::Running: return "running";
        case JobStatus::Paused: return "paused";
    }
    return "unknown";
}

/// Delay before searching again when no run exists within the horizon.
inline constexpr auto kDefaultRetryDelay = std::chrono::milliseconds(60 * 60 * 1000);

/// Options for CronJob::create / create_async; an empty clock means Clock::now.
struct CronJobOptions {
    std::chrono::milliseconds retry_delay = kDefaultRetryDelay;
    std::function<Timestamp()> clock;
};

/// A named schedule bound to a handler.
///
/// Runs within a Boost.Asio io_context and never blocks it: while running,
/// exactly one timer is armed for the next matching instant. When it fires
/// the handler is invoked, awaited, and the timer re-armed.
///
///   idle --start()--> running --pause()--> paused --resume()--> running
///   running/paused --stop()--> idle
///
/// Any other call is a no-op. Handler failures are logged and counted but
/// never change the status or stop future firings. Control calls must be
/// made from the io_context's thread; there is no internal locking.
class CronJob : public std::enable_shared_from_this<CronJob> {
public:
    /// Synchronous handler.
    using Handler = std::function<void()>;

    /// Coroutine handler: an async function with no arguments returning void.
    using AsyncHandler = std::function<awaitable<void>()>;

    /// Wall-clock source; empty means Clock::now.
    using NowFn = std::function<Timestamp()>;

    using Options = CronJobOptions;

    /// Create an idle job. Fails without creating anything if the name or
    /// handler is empty or the schedule is not a valid alias/expression.
    static auto create(boost::asio::io_context& ioc, std::string_view name,
                       std::string_view schedule, Handler handler,
                       Options options = {})
        -> Result<std::shared_ptr<CronJob>>;

    static auto create_async(boost::asio::io_context& ioc, std::string_view name,
                             std::string_view schedule, AsyncHandler handler,
                             Options options = {})
        -> Result<std::shared_ptr<CronJob>>;

    ~CronJob();

    CronJob(const CronJob&) = delete;
    CronJob& operator=(const CronJob&) = delete;

    void start();
    void pause();
    void resume();
    void stop();

    /// Invoke the handler once now, outside the schedule. Status and the
    /// pending timer are left untouched.
    void run_now();

    [[nodiscard]] auto status() const noexcept -> JobStatus { return status_; }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    /// The schedule string as given at construction.
    [[nodiscard]] auto source() const noexcept -> const std::string& { return source_; }

    /// The field expression after alias substitution.
    [[nodiscard]] auto expression() const noexcept -> const std::string& { return expression_; }

    [[nodiscard]] auto schedule() const noexcept -> const ParsedSchedule& { return schedule_; }

    [[nodiscard]] auto matches(Timestamp t) const -> bool;
    [[nodiscard]] auto next_run(Timestamp from = Clock::now()) const -> std::optional<Timestamp>;

    [[nodiscard]] auto has_pending_task() const noexcept -> bool { return task_.pending(); }
    [[nodiscard]] auto handler_running() const noexcept -> bool { return in_flight_ > 0; }
    [[nodiscard]] auto fire_count() const noexcept -> std::uint64_t { return fire_count_; }
    [[nodiscard]] auto failure_count() const noexcept -> std::uint64_t { return failure_count_; }

private:
    CronJob(boost::asio::io_context& ioc, std::string name, std::string source,
            std::string expression, ParsedSchedule schedule,
            AsyncHandler handler, Options options);

    [[nodiscard]] auto now() const -> Timestamp;

    /// Arm the timer for the next run after both now and the last fired
    /// occurrence, or for a retry after an empty horizon.
    void arm_next();

    void fire();
    void spawn_handler();
    auto invoke_handler() -> awaitable<void>;
    void on_handler_done(std::exception_ptr error);

    boost::asio::io_context& ioc_;
    const std::string name_;
    const std::string source_;
    const std::string expression_;
    const ParsedSchedule schedule_;
    AsyncHandler handler_;
    Options options_;

    JobStatus status_ = JobStatus::Idle;
    DelayedTask task_;
    Timestamp target_{};
    std::optional<Timestamp> last_fired_;
    int in_flight_ = 0;
    std::uint64_t fire_count_ = 0;
    std::uint64_t failure_count_ = 0;
};

} // namespace cronlet::cron
