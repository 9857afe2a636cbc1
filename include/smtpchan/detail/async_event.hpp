/*

async_event.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Manual-reset event for coroutines running on one executor. A waiter may give a
deadline; when it elapses first the wait reports false and the waiter stops
listening, while whoever would have set the event carries on unaware.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <utility>

#include <smtpchan/detail/asio_decl.hpp>

namespace smtpchan::detail
{

class async_event
{
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    explicit async_event(smtpchan::asio::any_io_executor executor, bool initially_set = false)
        : executor_(std::move(executor)),
          set_(initially_set)
    {
    }

    async_event(const async_event&) = delete;
    async_event& operator=(const async_event&) = delete;

    /// Wake every waiter; later waits complete immediately until reset().
    void set() noexcept
    {
        set_ = true;
        auto waiters = std::exchange(waiters_, {});
        for (auto& waiter : waiters)
        {
            waiter->ready = true;
            smtpchan::asio::error_code ignored;
            waiter->timer.cancel(ignored);
        }
    }

    void reset() noexcept
    {
        set_ = false;
    }

    [[nodiscard]] bool is_set() const noexcept
    {
        return set_;
    }

    /**
    Wait until the event is set or the deadline passes.

    @return true when the event was set, false when the deadline won.
    **/
    smtpchan::asio::awaitable<bool> wait_until(std::optional<time_point> deadline)
    {
        if (set_)
            co_return true;

        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(deadline.value_or(time_point::max()));
        waiters_.push_back(waiter);

        smtpchan::asio::error_code ec;
        co_await waiter->timer.async_wait(smtpchan::asio::redirect_error(smtpchan::asio::use_awaitable, ec));

        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
            waiters_.erase(it);
        co_return waiter->ready;
    }

    smtpchan::asio::awaitable<bool> wait()
    {
        return wait_until(std::nullopt);
    }

private:
    struct waiter_t
    {
        explicit waiter_t(smtpchan::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        smtpchan::asio::steady_timer timer;
        bool ready{false};
    };

    smtpchan::asio::any_io_executor executor_;
    bool set_;
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace smtpchan::detail
