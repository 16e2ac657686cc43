#include "cronlet/cron/job.hpp"
#include "cronlet/core/logger.hpp"
#include "cronlet/cron/matcher.hpp"
#include "cronlet/cron/parser.hpp"
#include "cronlet/cron/search.hpp"

#include <algorithm>

#include <boost/asio/co_spawn.hpp>

namespace cronlet::cron {

namespace {

auto run_sync(CronJob::Handler handler) -> awaitable<void> {
    handler();
    co_return;
}

auto validate(std::string_view name, bool has_handler) -> VoidResult {
    if (name.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Cron job name must not be empty"));
    }
    if (!has_handler) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Cron job handler must not be null",
            std::string(name)));
    }
    return {};
}

} // anonymous namespace

auto CronJob::create(boost::asio::io_context& ioc, std::string_view name,
                     std::string_view schedule, Handler handler,
                     Options options) -> Result<std::shared_ptr<CronJob>>
{
    if (auto valid = validate(name, static_cast<bool>(handler)); !valid) {
        return std::unexpected(valid.error());
    }
    return create_async(
        ioc, name, schedule,
        [handler = std::move(handler)]() { return run_sync(handler); },
        options);
}

auto CronJob::create_async(boost::asio::io_context& ioc, std::string_view name,
                           std::string_view schedule, AsyncHandler handler,
                           Options options) -> Result<std::shared_ptr<CronJob>>
{
    if (auto valid = validate(name, static_cast<bool>(handler)); !valid) {
        return std::unexpected(valid.error());
    }

    auto parsed = parse_schedule(schedule);
    if (!parsed) {
        LOG_DEBUG("Rejected schedule '{}' for cron job '{}': {}",
                  schedule, name, parsed.error().what());
        return std::unexpected(parsed.error());
    }

    return std::shared_ptr<CronJob>(new CronJob(
        ioc, std::string(name), std::string(schedule),
        std::string(resolve_alias(schedule)), std::move(*parsed),
        std::move(handler), options));
}

CronJob::CronJob(boost::asio::io_context& ioc, std::string name, std::string source,
                 std::string expression, ParsedSchedule schedule,
                 AsyncHandler handler, Options options)
    : ioc_(ioc)
    , name_(std::move(name))
    , source_(std::move(source))
    , expression_(std::move(expression))
    , schedule_(std::move(schedule))
    , handler_(std::move(handler))
    , options_(options)
    , task_(ioc)
{
}

CronJob::~CronJob() {
    task_.cancel();
}

void CronJob::start() {
    if (status_ != JobStatus::Idle) {
        LOG_DEBUG("Cron job '{}' start ignored while {}", name_, to_string(status_));
        return;
    }
    status_ = JobStatus::Running;
    LOG_INFO("Cron job '{}' started with schedule '{}'", name_, source_);
    arm_next();
}

void CronJob::pause() {
    if (status_ != JobStatus::Running) return;
    status_ = JobStatus::Paused;
    task_.cancel();
    LOG_INFO("Cron job '{}' paused", name_);
}

void CronJob::resume() {
    if (status_ != JobStatus::Paused) return;
    status_ = JobStatus::Running;
    LOG_INFO("Cron job '{}' resumed", name_);
    arm_next();
}

void CronJob::stop() {
    if (status_ == JobStatus::Idle) return;
    status_ = JobStatus::Idle;
    task_.cancel();
    LOG_INFO("Cron job '{}' stopped", name_);
}

void CronJob::run_now() {
    LOG_INFO("Manually triggered cron job '{}'", name_);
    spawn_handler();
}

auto CronJob::matches(Timestamp t) const -> bool {
    return cron::matches(schedule_, t);
}

auto CronJob::next_run(Timestamp from) const -> std::optional<Timestamp> {
    return cron::next_run(schedule_, from);
}

auto CronJob::now() const -> Timestamp {
    return options_.clock ? options_.clock() : Clock::now();
}

void CronJob::arm_next() {
    if (status_ != JobStatus::Running) return;

    std::weak_ptr<CronJob> weak = weak_from_this();
    const auto current = now();
    // A wall clock stepped backwards must not bring an occurrence that
    // already ran back into view.
    auto from = current;
    if (last_fired_ && *last_fired_ > from) from = *last_fired_;
    auto next = next_run(from);

    if (!next) {
        LOG_WARN("Cron job '{}' has no run within the search horizon, retrying in {} ms",
                 name_, options_.retry_delay.count());
        task_.arm(options_.retry_delay, [weak]() {
            if (auto self = weak.lock()) self->arm_next();
        });
        return;
    }

    target_ = *next;
    auto delay = std::max(Clock::duration::zero(), target_ - current);
    LOG_DEBUG("Cron job '{}' next run in {} ms", name_,
              std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());

    task_.arm(std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay),
              [weak]() {
                  if (auto self = weak.lock()) self->fire();
              });
}

void CronJob::fire() {
    if (status_ != JobStatus::Running) return;

    // The timer runs on the steady clock; the wall clock may have been
    // set back since arming.
    if (now() < target_) {
        LOG_DEBUG("Cron job '{}' woke before its run time, re-arming", name_);
        arm_next();
        return;
    }

    LOG_DEBUG("Firing cron job '{}'", name_);
    last_fired_ = target_;
    spawn_handler();
}

void CronJob::spawn_handler() {
    ++fire_count_;
    ++in_flight_;

    std::weak_ptr<CronJob> weak = weak_from_this();
    boost::asio::co_spawn(
        ioc_,
        [self = shared_from_this()]() -> awaitable<void> {
            co_await self->invoke_handler();
        },
        [weak](std::exception_ptr error) {
            if (auto self = weak.lock()) self->on_handler_done(error);
        });
}

auto CronJob::invoke_handler() -> awaitable<void> {
    try {
        co_await handler_();
    } catch (const std::exception& e) {
        ++failure_count_;
        LOG_ERROR("Cron job '{}' failed: {}", name_, e.what());
    }
}

void CronJob::on_handler_done(std::exception_ptr error) {
    --in_flight_;

    if (error) {
        // Only non-std exceptions get this far; invoke_handler() logs the rest.
        ++failure_count_;
        LOG_ERROR("Cron job '{}' failed with a non-standard exception", name_);
    }

    // A pause/resume or stop/start while the handler ran may already have
    // armed the next run.
    if (status_ == JobStatus::Running && !task_.pending()) {
        arm_next();
    }
}

} // namespace cronlet::cron
