#include "cronlet/cron/delayed_task.hpp"
#include "cronlet/core/logger.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace cronlet::cron {

DelayedTask::DelayedTask(boost::asio::io_context& ioc)
    : timer_(ioc)
    , state_(std::make_shared<State>())
{
}

DelayedTask::~DelayedTask() {
    cancel();
}

auto DelayedTask::arm(std::chrono::steady_clock::duration delay, Callback callback) -> Token {
    cancel();

    auto token = ++state_->last_issued;
    state_->armed = token;

    timer_.expires_after(delay);
    timer_.async_wait(
        [state = state_, token, callback = std::move(callback)](
            const boost::system::error_code& ec) {
            if (state->armed != token) return;  // cancelled or superseded
            state->armed = 0;
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_WARN("Delayed task timer error: {}", ec.message());
                }
                return;
            }
            callback();
        });

    return token;
}

void DelayedTask::cancel() {
    state_->armed = 0;
    timer_.cancel();
}

auto DelayedTask::pending() const noexcept -> bool {
    return state_->armed != 0;
}

auto DelayedTask::token() const noexcept -> Token {
    return state_->armed;
}

} // namespace cronlet::cron
