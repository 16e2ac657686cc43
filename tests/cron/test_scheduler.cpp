#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "cronlet/cron/scheduler.hpp"

using namespace cronlet::cron;
using cronlet::ErrorCode;
using namespace std::chrono_literals;

TEST_CASE("CronScheduler registration", "[cron][scheduler]") {
    boost::asio::io_context ioc;
    CronScheduler scheduler(ioc);
    auto noop = []() {};

    SECTION("add and look up") {
        REQUIRE(scheduler.add("backup", "0 3 * * *", noop).has_value());
        REQUIRE(scheduler.size() == 1);

        auto job = scheduler.get("backup");
        REQUIRE(job != nullptr);
        CHECK(job->name() == "backup");
        CHECK(job->status() == JobStatus::Idle);
        CHECK(scheduler.get("missing") == nullptr);
    }

    SECTION("duplicate names are rejected") {
        REQUIRE(scheduler.add("backup", "0 3 * * *", noop).has_value());
        auto again = scheduler.add("backup", "@daily", noop);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code() == ErrorCode::AlreadyExists);
        CHECK(scheduler.get("backup")->source() == "0 3 * * *");
    }

    SECTION("invalid schedules are not registered") {
        auto result = scheduler.add("broken", "* * * *", noop);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::LengthMismatch);
        CHECK(scheduler.size() == 0);
    }

    SECTION("names are sorted") {
        REQUIRE(scheduler.add("zeta", "@hourly", noop).has_value());
        REQUIRE(scheduler.add("alpha", "@daily", noop).has_value());
        REQUIRE(scheduler.add_async("mid", "@weekly",
            []() -> boost::asio::awaitable<void> { co_return; }).has_value());
        CHECK(scheduler.names() == std::vector<std::string>{"alpha", "mid", "zeta"});
    }

    SECTION("remove stops and drops the job") {
        REQUIRE(scheduler.add("temp", "@hourly", noop).has_value());
        auto job = scheduler.get("temp");
        job->start();
        REQUIRE(job->has_pending_task());

        REQUIRE(scheduler.remove("temp").has_value());
        CHECK(scheduler.size() == 0);
        CHECK(job->status() == JobStatus::Idle);
        CHECK_FALSE(job->has_pending_task());

        auto missing = scheduler.remove("temp");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("CronScheduler bulk control", "[cron][scheduler]") {
    boost::asio::io_context ioc;
    CronScheduler scheduler(ioc);
    REQUIRE(scheduler.add("a", "@hourly", []() {}).has_value());
    REQUIRE(scheduler.add("b", "@daily", []() {}).has_value());

    auto status_of = [&](std::string_view name) { return scheduler.get(name)->status(); };

    scheduler.start_all();
    CHECK(status_of("a") == JobStatus::Running);
    CHECK(status_of("b") == JobStatus::Running);

    scheduler.pause_all();
    CHECK(status_of("a") == JobStatus::Paused);
    CHECK_FALSE(scheduler.get("b")->has_pending_task());

    scheduler.resume_all();
    CHECK(status_of("b") == JobStatus::Running);
    CHECK(scheduler.get("b")->has_pending_task());

    scheduler.stop_all();
    CHECK(status_of("a") == JobStatus::Idle);
    CHECK(status_of("b") == JobStatus::Idle);
}

TEST_CASE("CronScheduler manual run", "[cron][scheduler]") {
    boost::asio::io_context ioc;
    CronScheduler scheduler(ioc);

    SECTION("unknown job") {
        auto result = scheduler.run_now("nonexistent");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("existing job runs without being started") {
        bool ran = false;
        REQUIRE(scheduler.add("task", "@yearly", [&ran]() { ran = true; }).has_value());

        REQUIRE(scheduler.run_now("task").has_value());
        ioc.run_for(100ms);
        CHECK(ran);
        CHECK(scheduler.get("task")->status() == JobStatus::Idle);
    }
}
