#include "cronlet/cron/scheduler.hpp"
#include "cronlet/core/logger.hpp"

namespace cronlet::cron {

CronScheduler::CronScheduler(boost::asio::io_context& ioc, CronJob::Options options)
    : ioc_(ioc)
    , options_(options)
{
}

CronScheduler::~CronScheduler() {
    stop_all();
}

auto CronScheduler::add(std::string_view name, std::string_view schedule,
                        CronJob::Handler handler) -> VoidResult
{
    if (jobs_.contains(name)) {
        return std::unexpected(make_error(
            ErrorCode::AlreadyExists,
            "A cron job with this name already exists",
            std::string(name)));
    }
    return insert(name, CronJob::create(ioc_, name, schedule, std::move(handler), options_));
}

auto CronScheduler::add_async(std::string_view name, std::string_view schedule,
                              CronJob::AsyncHandler handler) -> VoidResult
{
    if (jobs_.contains(name)) {
        return std::unexpected(make_error(
            ErrorCode::AlreadyExists,
            "A cron job with this name already exists",
            std::string(name)));
    }
    return insert(name,
                  CronJob::create_async(ioc_, name, schedule, std::move(handler), options_));
}

auto CronScheduler::insert(std::string_view name, Result<std::shared_ptr<CronJob>> job)
    -> VoidResult
{
    if (!job) {
        return std::unexpected(job.error());
    }
    LOG_INFO("Registered cron job '{}' with schedule '{}'", name, (*job)->source());
    jobs_.emplace(std::string(name), std::move(*job));
    return {};
}

auto CronScheduler::remove(std::string_view name) -> VoidResult {
    auto it = jobs_.find(name);
    if (it == jobs_.end()) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "No cron job with this name",
            std::string(name)));
    }

    it->second->stop();
    jobs_.erase(it);
    LOG_INFO("Removed cron job '{}'", name);
    return {};
}

auto CronScheduler::get(std::string_view name) const -> std::shared_ptr<CronJob> {
    auto it = jobs_.find(name);
    return it == jobs_.end() ? nullptr : it->second;
}

void CronScheduler::start_all() {
    for (auto& [_, job] : jobs_) job->start();
}

void CronScheduler::pause_all() {
    for (auto& [_, job] : jobs_) job->pause();
}

void CronScheduler::resume_all() {
    for (auto& [_, job] : jobs_) job->resume();
}

void CronScheduler::stop_all() {
    for (auto& [_, job] : jobs_) job->stop();
}

auto CronScheduler::run_now(std::string_view name) -> VoidResult {
    auto job = get(name);
    if (!job) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "No cron job with this name",
            std::string(name)));
    }
    job->run_now();
    return {};
}

auto CronScheduler::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(jobs_.size());
    for (const auto& [name, _] : jobs_) {
        result.push_back(name);
    }
    return result;
}

} // namespace cronlet::cron
