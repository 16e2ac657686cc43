#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace cronlet::cron {

/// A cancellable, single-shot, re-armable timer callback.
///
/// At most one fire is pending at a time. Every arm() hands out a fresh
/// token; a fire only runs its callback if its token is still the armed
/// one, so a completion that was already queued when cancel() or a new
/// arm() happened is discarded.
class DelayedTask {
public:
    using Token = std::uint64_t;
    using Callback = std::function<void()>;

    explicit DelayedTask(boost::asio::io_context& ioc);
    ~DelayedTask();

    DelayedTask(const DelayedTask&) = delete;
    DelayedTask& operator=(const DelayedTask&) = delete;

    /// Cancel any pending fire and schedule `callback` after `delay`.
    auto arm(std::chrono::steady_clock::duration delay, Callback callback) -> Token;

    /// Drop the pending fire, if any. A callback already running is not affected.
    void cancel();

    [[nodiscard]] auto pending() const noexcept -> bool;

    /// Token of the pending fire, or 0 when nothing is armed.
    [[nodiscard]] auto token() const noexcept -> Token;

private:
    struct State {
        Token armed = 0;
        Token last_issued = 0;
    };

    boost::asio::steady_timer timer_;
    // Shared with in-flight completion handlers so they never touch a
    // destroyed DelayedTask.
    std::shared_ptr<State> state_;
};

} // namespace cronlet::cron
