#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "cronlet/core/error.hpp"
#include "cronlet/cron/job.hpp"

namespace cronlet::cron {

/// Owns a set of named cron jobs sharing one io_context.
///
/// Jobs are created idle; start_all() (or get(name)->start()) arms them.
/// Like CronJob itself, the registry is meant to be driven from the
/// io_context's thread and does no locking.
class CronScheduler {
public:
    explicit CronScheduler(boost::asio::io_context& ioc, CronJob::Options options = {});

    ~CronScheduler();

    // Non-copyable, non-movable.
    CronScheduler(const CronScheduler&) = delete;
    CronScheduler& operator=(const CronScheduler&) = delete;

    /// Register a job with a synchronous handler.
    ///
    /// @param name      Unique job name.
    /// @param schedule  Alias or 5/6-field cron expression.
    /// @param handler   Invoked on every match.
    /// @returns         AlreadyExists for a taken name, otherwise any
    ///                  construction error of CronJob::create().
    auto add(std::string_view name, std::string_view schedule, CronJob::Handler handler)
        -> VoidResult;

    /// Register a job with a coroutine handler.
    auto add_async(std::string_view name, std::string_view schedule,
                   CronJob::AsyncHandler handler) -> VoidResult;

    /// Stop and drop a job.
    /// @returns NotFound if no job with this name exists.
    auto remove(std::string_view name) -> VoidResult;

    /// The job registered under `name`, or null.
    [[nodiscard]] auto get(std::string_view name) const -> std::shared_ptr<CronJob>;

    void start_all();
    void pause_all();
    void resume_all();
    void stop_all();

    /// Invoke a job's handler immediately, outside its schedule.
    auto run_now(std::string_view name) -> VoidResult;

    /// Registered job names in ascending order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> size_t { return jobs_.size(); }

private:
    auto insert(std::string_view name, Result<std::shared_ptr<CronJob>> job) -> VoidResult;

    boost::asio::io_context& ioc_;
    CronJob::Options options_;
    std::map<std::string, std::shared_ptr<CronJob>, std::less<>> jobs_;
};

} // namespace cronlet::cron
