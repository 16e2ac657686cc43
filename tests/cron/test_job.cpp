#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "cronlet/core/utils.hpp"
#include "cronlet/cron/job.hpp"

using namespace cronlet::cron;
using cronlet::ErrorCode;
using cronlet::utils::make_local_time;
using namespace std::chrono_literals;

TEST_CASE("CronJob creation", "[cron][job]") {
    boost::asio::io_context ioc;
    auto noop = []() {};

    SECTION("valid expression starts idle") {
        auto job = CronJob::create(ioc, "report", "*/5 * * * *", noop);
        REQUIRE(job.has_value());
        CHECK((*job)->status() == JobStatus::Idle);
        CHECK((*job)->name() == "report");
        CHECK((*job)->source() == "*/5 * * * *");
        CHECK((*job)->expression() == "*/5 * * * *");
        CHECK_FALSE((*job)->has_pending_task());
    }

    SECTION("alias keeps its source and exposes the expansion") {
        auto job = CronJob::create(ioc, "nightly", "@daily", noop);
        REQUIRE(job.has_value());
        CHECK((*job)->source() == "@daily");
        CHECK((*job)->expression() == "0 0 * * *");
    }

    SECTION("invalid schedules produce no job") {
        auto empty = CronJob::create(ioc, "a", "", noop);
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code() == ErrorCode::EmptyExpression);

        auto short_expr = CronJob::create(ioc, "a", "* * * *", noop);
        REQUIRE_FALSE(short_expr.has_value());
        CHECK(short_expr.error().code() == ErrorCode::LengthMismatch);

        auto bad_token = CronJob::create(ioc, "a", "1e1 * * * *", noop);
        REQUIRE_FALSE(bad_token.has_value());
        CHECK(bad_token.error().code() == ErrorCode::MalformedToken);

        auto out_of_bound = CronJob::create(ioc, "a", "* * * * 7", noop);
        REQUIRE_FALSE(out_of_bound.has_value());
        CHECK(out_of_bound.error().code() == ErrorCode::OutOfBound);

        auto inverted = CronJob::create(ioc, "a", "20-10 * * * *", noop);
        REQUIRE_FALSE(inverted.has_value());
        CHECK(inverted.error().code() == ErrorCode::InvalidValue);
    }

    SECTION("missing name or handler") {
        auto unnamed = CronJob::create(ioc, "", "* * * * *", noop);
        REQUIRE_FALSE(unnamed.has_value());
        CHECK(unnamed.error().code() == ErrorCode::InvalidArgument);

        auto no_handler = CronJob::create(ioc, "a", "* * * * *", CronJob::Handler{});
        REQUIRE_FALSE(no_handler.has_value());
        CHECK(no_handler.error().code() == ErrorCode::InvalidArgument);

        auto no_async_handler =
            CronJob::create_async(ioc, "a", "* * * * *", CronJob::AsyncHandler{});
        REQUIRE_FALSE(no_async_handler.has_value());
        CHECK(no_async_handler.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("CronJob introspection", "[cron][job]") {
    boost::asio::io_context ioc;
    auto job = CronJob::create(ioc, "midsummer", "0 0 15 6 *", []() {});
    REQUIRE(job.has_value());

    CHECK((*job)->matches(make_local_time(2025, 6, 15)));
    CHECK_FALSE((*job)->matches(make_local_time(2025, 6, 14)));

    auto next = (*job)->next_run(make_local_time(2025, 1, 1));
    REQUIRE(next.has_value());
    CHECK(*next == make_local_time(2025, 6, 15));
}

TEST_CASE("CronJob status transitions", "[cron][job]") {
    boost::asio::io_context ioc;
    auto created = CronJob::create(ioc, "transitions", "@hourly", []() {});
    REQUIRE(created.has_value());
    auto job = *created;

    SECTION("from idle only start changes status") {
        job->pause();
        CHECK(job->status() == JobStatus::Idle);
        job->resume();
        CHECK(job->status() == JobStatus::Idle);
        job->stop();
        CHECK(job->status() == JobStatus::Idle);
        CHECK_FALSE(job->has_pending_task());

        job->start();
        CHECK(job->status() == JobStatus::Running);
        CHECK(job->has_pending_task());
    }

    SECTION("from running") {
        job->start();

        job->start();
        CHECK(job->status() == JobStatus::Running);
        job->resume();
        CHECK(job->status() == JobStatus::Running);
        CHECK(job->has_pending_task());

        SECTION("pause cancels the pending task") {
            job->pause();
            CHECK(job->status() == JobStatus::Paused);
            CHECK_FALSE(job->has_pending_task());
        }

        SECTION("stop cancels the pending task") {
            job->stop();
            CHECK(job->status() == JobStatus::Idle);
            CHECK_FALSE(job->has_pending_task());
        }
    }

    SECTION("from paused") {
        job->start();
        job->pause();

        job->start();
        CHECK(job->status() == JobStatus::Paused);
        job->pause();
        CHECK(job->status() == JobStatus::Paused);
        CHECK_FALSE(job->has_pending_task());

        SECTION("resume re-arms") {
            job->resume();
            CHECK(job->status() == JobStatus::Running);
            CHECK(job->has_pending_task());
        }

        SECTION("stop returns to idle") {
            job->stop();
            CHECK(job->status() == JobStatus::Idle);
            CHECK_FALSE(job->has_pending_task());
        }
    }

    SECTION("stopped jobs can start again") {
        job->start();
        job->stop();
        job->start();
        CHECK(job->status() == JobStatus::Running);
        CHECK(job->has_pending_task());
    }

    job->stop();
}

TEST_CASE("CronJob fires its handler on schedule", "[cron][job]") {
    boost::asio::io_context ioc;
    int calls = 0;
    auto created = CronJob::create(ioc, "every-second", "* * * * * *",
                                   [&calls]() { ++calls; });
    REQUIRE(created.has_value());
    auto job = *created;

    job->start();
    ioc.run_for(2500ms);

    CHECK(calls >= 1);
    CHECK(job->fire_count() == static_cast<std::uint64_t>(calls));
    CHECK(job->failure_count() == 0);
    CHECK(job->status() == JobStatus::Running);
    CHECK(job->has_pending_task());

    job->stop();
}

TEST_CASE("CronJob handler failures are isolated", "[cron][job]") {
    boost::asio::io_context ioc;
    auto created = CronJob::create(ioc, "flaky", "* * * * * *",
                                   []() { throw std::runtime_error("boom"); });
    REQUIRE(created.has_value());
    auto job = *created;

    job->start();
    ioc.run_for(2500ms);

    CHECK(job->fire_count() >= 1);
    CHECK(job->failure_count() == job->fire_count());
    CHECK(job->status() == JobStatus::Running);
    CHECK(job->has_pending_task());

    job->stop();
}

TEST_CASE("CronJob awaits coroutine handlers", "[cron][job]") {
    boost::asio::io_context ioc;
    bool finished = false;

    auto created = CronJob::create_async(ioc, "slow", "@yearly",
        [&finished]() -> boost::asio::awaitable<void> {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(100ms);
            co_await timer.async_wait(boost::asio::use_awaitable);
            finished = true;
        });
    REQUIRE(created.has_value());
    auto job = *created;

    SECTION("manual run of an idle job") {
        job->run_now();
        ioc.run_for(30ms);
        CHECK(job->handler_running());
        CHECK_FALSE(finished);

        ioc.restart();
        ioc.run_for(500ms);
        CHECK_FALSE(job->handler_running());
        CHECK(finished);
        CHECK(job->fire_count() == 1);
        CHECK(job->status() == JobStatus::Idle);
        CHECK_FALSE(job->has_pending_task());
    }

    SECTION("stop during a handler does not interrupt it or re-arm") {
        job->start();
        job->run_now();
        ioc.run_for(30ms);
        CHECK(job->handler_running());

        job->stop();
        CHECK_FALSE(job->has_pending_task());

        ioc.restart();
        ioc.run_for(500ms);
        CHECK(finished);
        CHECK(job->status() == JobStatus::Idle);
        CHECK_FALSE(job->has_pending_task());
    }

    SECTION("manual run of a running job keeps a single pending task") {
        job->start();
        job->run_now();

        ioc.run_for(500ms);
        CHECK(finished);
        CHECK(job->status() == JobStatus::Running);
        CHECK(job->has_pending_task());

        job->stop();
    }
}

TEST_CASE("CronJob keeps retrying when no run exists", "[cron][job]") {
    boost::asio::io_context ioc;
    int calls = 0;
    auto created = CronJob::create(ioc, "never", "0 0 30 2 *", [&calls]() { ++calls; },
                                   CronJob::Options{.retry_delay = 20ms});
    REQUIRE(created.has_value());
    auto job = *created;

    CHECK_FALSE(job->next_run().has_value());

    job->start();
    CHECK(job->status() == JobStatus::Running);
    CHECK(job->has_pending_task());

    ioc.run_for(150ms);
    CHECK(calls == 0);
    CHECK(job->status() == JobStatus::Running);
    CHECK(job->has_pending_task());

    job->stop();
    CHECK_FALSE(job->has_pending_task());
}

TEST_CASE("CronJob default retry delay is one hour", "[cron][job]") {
    CHECK(kDefaultRetryDelay == std::chrono::hours(1));
    CHECK(CronJob::Options{}.retry_delay == std::chrono::hours(1));
}

TEST_CASE("CronJob tolerates the wall clock stepping backwards", "[cron][job]") {
    boost::asio::io_context ioc;
    const auto base = make_local_time(2025, 6, 15, 12, 0, 0);
    auto wall = std::make_shared<cronlet::Timestamp>(base + 900ms);

    int calls = 0;
    auto created = CronJob::create(ioc, "stepped", "* * * * * *", [&calls]() { ++calls; },
        CronJob::Options{
            .retry_delay = kDefaultRetryDelay,
            .clock = [wall]() { return *wall; },
        });
    REQUIRE(created.has_value());
    auto job = *created;

    // Armed for base + 1s, 100ms away.
    job->start();
    REQUIRE(job->has_pending_task());

    // The timer wakes while the wall clock reads half a second earlier.
    *wall = base + 500ms;
    ioc.run_for(150ms);
    CHECK(calls == 0);
    CHECK(job->has_pending_task());

    // The re-armed timer fires once the run time is reached.
    *wall = base + 1s;
    ioc.run_for(600ms);
    CHECK(calls == 1);
    CHECK(job->has_pending_task());

    // Going back before the occurrence that already ran does not repeat it.
    *wall = base + 950ms;
    job->pause();
    job->resume();
    *wall = base + 1500ms;
    ioc.run_for(300ms);
    CHECK(calls == 1);
    CHECK(job->status() == JobStatus::Running);
    CHECK(job->has_pending_task());

    job->stop();
}
