#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include <boost/asio/io_context.hpp>

#include "cronlet/cron/delayed_task.hpp"

using cronlet::cron::DelayedTask;
using namespace std::chrono_literals;

TEST_CASE("DelayedTask fires once", "[cron][delayed_task]") {
    boost::asio::io_context ioc;
    DelayedTask task(ioc);
    int fired = 0;

    CHECK_FALSE(task.pending());
    CHECK(task.token() == 0);

    auto token = task.arm(10ms, [&fired]() { ++fired; });
    CHECK(token != 0);
    CHECK(task.pending());
    CHECK(task.token() == token);

    ioc.run_for(200ms);
    CHECK(fired == 1);
    CHECK_FALSE(task.pending());
    CHECK(task.token() == 0);
}

TEST_CASE("DelayedTask cancel drops the pending fire", "[cron][delayed_task]") {
    boost::asio::io_context ioc;
    DelayedTask task(ioc);
    int fired = 0;

    task.arm(10ms, [&fired]() { ++fired; });
    task.cancel();
    CHECK_FALSE(task.pending());

    ioc.run_for(100ms);
    CHECK(fired == 0);

    // Cancelling with nothing armed is harmless.
    task.cancel();
    CHECK_FALSE(task.pending());
}

TEST_CASE("DelayedTask re-arm supersedes the previous fire", "[cron][delayed_task]") {
    boost::asio::io_context ioc;
    DelayedTask task(ioc);
    int first = 0;
    int second = 0;

    auto t1 = task.arm(10ms, [&first]() { ++first; });
    auto t2 = task.arm(20ms, [&second]() { ++second; });
    CHECK(t2 != t1);
    CHECK(task.token() == t2);

    ioc.run_for(200ms);
    CHECK(first == 0);
    CHECK(second == 1);
}

TEST_CASE("DelayedTask can re-arm from its own callback", "[cron][delayed_task]") {
    boost::asio::io_context ioc;
    DelayedTask task(ioc);
    int fired = 0;

    std::function<void()> callback = [&]() {
        if (++fired < 3) task.arm(5ms, callback);
    };
    task.arm(5ms, callback);

    ioc.run_for(300ms);
    CHECK(fired == 3);
    CHECK_FALSE(task.pending());
}
