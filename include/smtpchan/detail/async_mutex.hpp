/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

FIFO mutex for coroutines sharing one executor. The channel uses it to keep
the bytes of two commands, or a command and a TLS handshake, from
interleaving on the socket.

*/

#pragma once

#include <deque>
#include <memory>
#include <utility>

#include <smtpchan/detail/asio_decl.hpp>

namespace smtpchan::detail
{

class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(smtpchan::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    /// Acquire in call order. Ownership passes directly to the next waiter on unlock.
    smtpchan::asio::awaitable<scoped_lock> lock()
    {
        if (!locked_)
        {
            locked_ = true;
            co_return scoped_lock(*this);
        }

        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(smtpchan::asio::steady_timer::time_point::max());
        waiters_.push_back(waiter);

        for (;;)
        {
            smtpchan::asio::error_code ec;
            co_await waiter->timer.async_wait(smtpchan::asio::redirect_error(smtpchan::asio::use_awaitable, ec));
            if (waiter->granted)
                break;
        }
        co_return scoped_lock(*this);
    }

    [[nodiscard]] bool is_locked() const noexcept
    {
        return locked_;
    }

private:
    struct waiter_t
    {
        explicit waiter_t(smtpchan::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        smtpchan::asio::steady_timer timer;
        bool granted{false};
    };

    void unlock() noexcept
    {
        if (waiters_.empty())
        {
            locked_ = false;
            return;
        }

        auto waiter = waiters_.front();
        waiters_.pop_front();
        waiter->granted = true;
        smtpchan::asio::error_code ignored;
        waiter->timer.cancel(ignored);
    }

    smtpchan::asio::any_io_executor executor_;
    bool locked_{false};
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace smtpchan::detail
