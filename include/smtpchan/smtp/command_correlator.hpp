/*

command_correlator.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <smtpchan/detail/async_event.hpp>
#include <smtpchan/detail/log.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/smtp/types.hpp>

namespace smtpchan
{
namespace smtp
{

/**
One command waiting for its reply block.

The reader appends lines and sets `ready`; the caller of settle() drains them.
**/
struct pending_command
{
    explicit pending_command(smtpchan::asio::any_io_executor executor)
        : ready(std::move(executor))
    {
    }

    std::deque<reply_line> lines;
    std::optional<error_info> failure;

    /// Terminal line seen; the command is no longer in the queue.
    bool complete{false};

    /// The caller gave up; remaining lines of the block are swallowed.
    bool abandoned{false};

    detail::async_event ready;
};

/**
Matches reply blocks to commands in send order.

Only the head of the queue receives lines. A terminal line pops it and arms
the next one. A command whose caller timed out stays queued until its own
block has arrived, so the block is never handed to a later command.
**/
class command_correlator
{
public:
    using time_point = std::chrono::steady_clock::time_point;

    explicit command_correlator(smtpchan::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    command_correlator(const command_correlator&) = delete;
    command_correlator& operator=(const command_correlator&) = delete;

    std::shared_ptr<pending_command> arm()
    {
        auto cmd = std::make_shared<pending_command>(executor_);
        queue_.push_back(cmd);
        return cmd;
    }

    /// Route one inbound line. Returns false when no command was armed.
    bool deliver(reply_line line)
    {
        if (queue_.empty())
        {
            SMTPCHAN_DEBUG("smtpchan: unsolicited reply dropped: " + line.text);
            return false;
        }

        auto cmd = queue_.front();
        const bool terminal = line.is_terminal;
        if (cmd->abandoned)
            SMTPCHAN_DEBUG("smtpchan: late reply to abandoned command: " + line.text);
        else
            cmd->lines.push_back(std::move(line));

        if (terminal)
        {
            cmd->complete = true;
            queue_.pop_front();
        }
        cmd->ready.set();
        return true;
    }

    /// Fail every outstanding command with `err` and empty the queue.
    void reject_all(const error_info& err)
    {
        auto queue = std::exchange(queue_, {});
        for (auto& cmd : queue)
        {
            if (!cmd->failure.has_value())
                cmd->failure = err;
            cmd->ready.set();
        }
    }

    /**
    Fail the head command without releasing its place in the queue.

    The rest of its block is swallowed until the terminal line, as for a
    timeout. With `terminal` set the block is already over and the head is
    popped.
    **/
    void fail_head(const error_info& err, bool terminal = false)
    {
        if (queue_.empty())
            return;

        auto cmd = queue_.front();
        if (!cmd->failure.has_value())
            cmd->failure = err;
        abandon(*cmd);
        if (terminal)
        {
            cmd->complete = true;
            queue_.pop_front();
        }
        cmd->ready.set();
    }

    /// Take back a command the server never received. Returns false if it already left the queue.
    bool withdraw(const std::shared_ptr<pending_command>& cmd, const error_info& err)
    {
        auto it = std::find(queue_.begin(), queue_.end(), cmd);
        if (it == queue_.end())
            return false;

        queue_.erase(it);
        if (!cmd->failure.has_value())
            cmd->failure = err;
        cmd->ready.set();
        return true;
    }

    [[nodiscard]] std::size_t outstanding() const noexcept
    {
        return queue_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return queue_.empty();
    }

    /**
    Wait for the reply block of `cmd`, passing each line to `handler`.

    @return Code of the terminal line, the stored failure, `errc::timeout`
            when the deadline passes first, or `errc::handler_failed`.
    **/
    static smtpchan::asio::awaitable<result<std::string>> settle(std::shared_ptr<pending_command> cmd,
        line_handler handler, std::optional<time_point> deadline)
    {
        for (;;)
        {
            while (!cmd->lines.empty())
            {
                reply_line line = std::move(cmd->lines.front());
                cmd->lines.pop_front();

                if (handler)
                {
                    try
                    {
                        handler(line.text, line.info());
                    }
                    catch (const std::exception& exc)
                    {
                        abandon(*cmd);
                        co_return fail<std::string>(errc::handler_failed, "Reply handler failed.", exc.what());
                    }
                }

                if (line.is_terminal)
                    co_return ok(std::move(line.code));
            }

            if (cmd->failure.has_value())
                co_return fail<std::string>(*cmd->failure);

            cmd->ready.reset();
            const bool woke = co_await cmd->ready.wait_until(deadline);
            if (!woke && cmd->lines.empty() && !cmd->failure.has_value())
            {
                abandon(*cmd);
                co_return fail<std::string>(errc::timeout, "Timeout exceeded.");
            }
        }
    }

private:
    static void abandon(pending_command& cmd) noexcept
    {
        cmd.abandoned = true;
        cmd.lines.clear();
    }

    smtpchan::asio::any_io_executor executor_;
    std::deque<std::shared_ptr<pending_command>> queue_;
};

} // namespace smtp
} // namespace smtpchan
