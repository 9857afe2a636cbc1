/*

smtp/channel.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/async_event.hpp>
#include <smtpchan/detail/async_mutex.hpp>
#include <smtpchan/detail/log.hpp>
#include <smtpchan/detail/redact.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/detail/timeout_config.hpp>

#include <smtpchan/net/error_mapping.hpp>
#include <smtpchan/net/line_splitter.hpp>
#include <smtpchan/net/transport.hpp>
#include <smtpchan/smtp/command_correlator.hpp>
#include <smtpchan/smtp/stream_adapter.hpp>
#include <smtpchan/smtp/types.hpp>

namespace smtpchan::smtp
{

using smtpchan::asio::any_io_executor;
using smtpchan::asio::awaitable;
using smtpchan::asio::io_context;
namespace ssl = smtpchan::asio::ssl;

enum class channel_state
{
    disconnected,
    connecting,
    connected,
    upgrading,
    closing
};

[[nodiscard]] constexpr std::string_view to_string(channel_state s) noexcept
{
    switch (s)
    {
        case channel_state::disconnected: return "disconnected";
        case channel_state::connecting: return "connecting";
        case channel_state::connected: return "connected";
        case channel_state::upgrading: return "upgrading";
        case channel_state::closing: return "closing";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, channel_state s)
{
    return os << to_string(s);
}

/**
Client end of an SMTP connection that knows nothing about SMTP commands.

The caller writes raw command bytes and gets back the reply block they provoke.
Replies are matched to commands in send order, each operation may race a
deadline, and the plain socket can be upgraded to TLS in the middle of the
session. All members must be used from the channel's executor, and the channel
must outlive every operation it started: await close() before destroying it.
**/
class channel
{
public:
    using executor_type = any_io_executor;
    using time_point = std::chrono::steady_clock::time_point;

    explicit channel(executor_type executor, channel_config config = {}, channel_events events = {})
        : executor_(executor),
          config_(std::move(config)),
          events_(std::move(events)),
          inbound_(config_.max_line_length),
          outbound_(config_.max_line_length),
          correlator_(executor_),
          write_mutex_(executor_),
          idle_timer_(executor_)
    {
    }

    explicit channel(io_context& context, channel_config config = {}, channel_events events = {})
        : channel(context.get_executor(), std::move(config), std::move(events))
    {
    }

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    executor_type get_executor() const { return executor_; }

    /**
    Open the connection and wait for the server greeting.

    Resolves with the greeting's reply code, or with an empty code when the
    channel is already connected.
    **/
    awaitable<result<std::string>> connect(command_options options = {})
    {
        if (state_ == channel_state::connected)
            co_return ok(std::string());
        if (state_ != channel_state::disconnected)
        {
            co_return fail<std::string>(errc::invalid_state, "Connection is already in progress.",
                "state=" + std::string(to_string(state_)));
        }

        state_ = channel_state::connecting;
        const std::uint64_t gen = ++generation_;
        inbound_.reset();
        outbound_.reset();
        auto greeting = correlator_.arm();
        SMTPCHAN_INFO("smtpchan: connecting to " + config_.host + ":" + std::to_string(config_.port));

        smtpchan::asio::co_spawn(executor_, establish(gen), smtpchan::asio::detached);
        co_return co_await command_correlator::settle(std::move(greeting), std::move(options.handler),
            timeout_config::deadline(options.timeout, config_.timeouts.connect));
    }

    /**
    Send a command and wait for its reply block.

    `data` holds the exact bytes to send, CRLF included. Every line of the
    reply block is passed to `options.handler`; the code of the terminal line
    is returned.
    **/
    awaitable<result<std::string>> write(payload data, command_options options = {})
    {
        auto tr = transport_;
        if (!tr)
            co_return fail<std::string>(errc::not_connected, "No connection to execute a write operation.");
        if (state_ != channel_state::connected)
        {
            co_return fail<std::string>(errc::invalid_state, "Channel cannot write in its current state.",
                "state=" + std::string(to_string(state_)));
        }

        auto cmd = correlator_.arm();
        smtpchan::asio::co_spawn(executor_, transmit(to_byte_source(std::move(data)), cmd, std::move(tr), generation_),
            smtpchan::asio::detached);
        co_return co_await command_correlator::settle(std::move(cmd), std::move(options.handler),
            timeout_config::deadline(options.timeout, config_.timeouts.command));
    }

    /**
    Close the connection.

    Outstanding commands fail with `errc::connection_closed`. Resolves once the
    reader has observed the closed socket.
    **/
    awaitable<result<void>> close(close_options options = {})
    {
        const auto closed = make_error(errc::connection_closed, "Connection closed unexpectedly.");
        auto tr = std::exchange(transport_, nullptr);
        ++generation_;
        secure_ = false;
        stop_idle_timer();

        if (!tr)
        {
            correlator_.reject_all(closed);
            state_ = channel_state::disconnected;
            co_return ok();
        }

        state_ = channel_state::closing;
        SMTPCHAN_INFO("smtpchan: closing connection to " + tr->host());
        correlator_.reject_all(closed);

        const bool reader_running = !tr->reader_idle().is_set();
        tr->destroy();
        if (!reader_running)
        {
            state_ = channel_state::disconnected;
            emit("close", events_.on_close);
            co_return ok();
        }

        const bool stopped = co_await tr->reader_idle().wait_until(
            timeout_config::deadline(options.timeout, config_.timeouts.close));
        state_ = channel_state::disconnected;
        if (!stopped)
            co_return fail<void>(errc::timeout, "Timeout exceeded.", "stage=close");
        co_return ok();
    }

    /**
    Switch the live connection to TLS.

    Call it after the server accepted STARTTLS. The reply handlers, the event
    observers and any bytes already buffered survive the switch. A failed
    handshake leaves the channel unusable until close().
    **/
    awaitable<result<void>> negotiate_tls(upgrade_options options = {})
    {
        if (!transport_)
            co_return fail<void>(errc::not_connected, "No connection to upgrade.");
        if (state_ != channel_state::connected)
        {
            co_return fail<void>(errc::invalid_state, "Channel cannot upgrade in its current state.",
                "state=" + std::string(to_string(state_)));
        }
        if (secure_)
            co_return fail<void>(errc::invalid_state, "Connection is already encrypted.");

        state_ = channel_state::upgrading;
        const auto deadline = timeout_config::deadline(options.timeout, config_.timeouts.upgrade);
        auto job = std::make_shared<upgrade_job>(executor_);
        smtpchan::asio::co_spawn(executor_, run_upgrade(transport_, generation_, std::move(options), job),
            smtpchan::asio::detached);

        const bool done = co_await job->done.wait_until(deadline);
        if (!done)
        {
            SMTPCHAN_WARN("smtpchan: TLS upgrade timed out");
            co_return fail<void>(errc::timeout, "Timeout exceeded.", "stage=upgrade");
        }
        co_return std::move(*job->outcome);
    }

    [[nodiscard]] bool is_secure() const noexcept { return secure_; }
    [[nodiscard]] channel_state state() const noexcept { return state_; }
    [[nodiscard]] std::size_t outstanding_commands() const noexcept { return correlator_.outstanding(); }
    [[nodiscard]] const channel_config& config() const noexcept { return config_; }

    void set_events(channel_events events) { events_ = std::move(events); }
    channel_events& events() noexcept { return events_; }

    static std::string parse_reply_code(std::string_view line)
    {
        return smtp::parse_reply_code(line);
    }

    static bool is_terminal_reply(std::string_view line) noexcept
    {
        return smtp::is_terminal_reply(line);
    }

private:
    struct upgrade_job
    {
        explicit upgrade_job(any_io_executor executor)
            : done(std::move(executor))
        {
        }

        std::optional<result<void>> outcome;
        detail::async_event done;
    };

    template<typename Fn, typename... Args>
    void emit(const char* name, const Fn& fn, Args&&... args)
    {
        if (!fn)
            return;
        try
        {
            fn(std::forward<Args>(args)...);
        }
        catch (const std::exception& exc)
        {
            SMTPCHAN_ERROR(std::string("smtpchan: ") + name + " observer failed: " + exc.what());
        }
    }

    void emit_error(const error_info& err)
    {
        emit("error", events_.on_error, err);
    }

    result<std::shared_ptr<ssl::context>> tls_context_for(const std::shared_ptr<ssl::context>& preferred)
    {
        if (preferred)
            return ok(preferred);
        if (config_.tls_context)
            return ok(config_.tls_context);
        if (!tls_context_)
        {
            try
            {
                tls_context_ = std::make_shared<ssl::context>(ssl::context::tls_client);
            }
            catch (const smtpchan::asio::system_error& exc)
            {
                return fail<std::shared_ptr<ssl::context>>(errc::tls_config_failed,
                    "TLS context creation failed.", exc.what(), exc.code());
            }
        }
        return ok(tls_context_);
    }

    awaitable<void> establish(std::uint64_t gen)
    {
        auto opened = co_await net::open_stream(executor_, config_.endpoint());
        if (gen != generation_)
        {
            if (opened)
                opened->close();
            co_return;
        }
        if (!opened)
        {
            fail_connect(gen, opened.error());
            co_return;
        }

        auto tr = std::make_shared<net::transport>(std::move(*opened), config_.host, config_.port);
        bool secure = false;
        if (config_.encrypted)
        {
            auto handshake = co_await handshake_tls(*tr, config_.tls_context, config_.tls, config_.sni);
            if (gen != generation_)
            {
                tr->destroy();
                co_return;
            }
            if (!handshake)
            {
                tr->destroy();
                fail_connect(gen, handshake.error());
                co_return;
            }
            secure = true;
        }

        transport_ = tr;
        secure_ = secure;
        state_ = channel_state::connected;
        SMTPCHAN_INFO("smtpchan: connected to " + config_.host + (secure ? " (TLS)" : ""));
        start_reader(tr, gen);
        start_idle_watcher(gen);
        emit("connect", events_.on_connect);
    }

    void fail_connect(std::uint64_t gen, const error_info& err)
    {
        if (gen != generation_)
            return;
        SMTPCHAN_WARN("smtpchan: connect failed: " + err.to_string());
        state_ = channel_state::disconnected;
        correlator_.reject_all(err);
        emit_error(err);
    }

    awaitable<result<void>> handshake_tls(net::transport& tr, const std::shared_ptr<ssl::context>& context,
        const net::tls_options& tls, const std::string& sni)
    {
        auto ctx = tls_context_for(context);
        if (!ctx)
            co_return fail<void>(std::move(ctx).error());
        auto server_name = net::resolve_sni(tr.host(), sni);
        if (!server_name)
            co_return fail<void>(std::move(server_name).error());
        co_return co_await tr.stream().start_tls(**ctx, std::move(*server_name), tls);
    }

    void start_reader(const std::shared_ptr<net::transport>& tr, std::uint64_t gen)
    {
        tr->detaching(false);
        tr->reader_idle().reset();
        smtpchan::asio::co_spawn(executor_, read_loop(tr, gen), smtpchan::asio::detached);
    }

    awaitable<void> read_loop(std::shared_ptr<net::transport> tr, std::uint64_t gen)
    {
        std::array<char, 4096> buffer{};
        bool socket_gone = false;
        for (;;)
        {
            if (tr->detaching())
                break;

            smtpchan::asio::error_code ec;
            const std::size_t n = co_await tr->stream().async_read_some(smtpchan::asio::buffer(buffer),
                smtpchan::asio::redirect_error(smtpchan::asio::use_awaitable, ec));
            if (n > 0 && gen == generation_)
                on_data(std::string_view(buffer.data(), n));
            if (!ec)
                continue;

            if (tr->detaching() && gen == generation_)
                break;

            socket_gone = true;
            if (gen != generation_)
                break;

            if (ec == smtpchan::asio::error::eof)
            {
                SMTPCHAN_INFO("smtpchan: server closed the connection");
                emit("end", events_.on_end);
                teardown(make_error(errc::connection_closed, "Connection closed unexpectedly."));
            }
            else
            {
                auto err = net::make_net_error(net::io_stage::read, ec, tr->host(), tr->port());
                SMTPCHAN_WARN("smtpchan: read failed: " + err.to_string());
                emit_error(err);
                teardown(err);
            }
            break;
        }

        if (socket_gone)
            emit("close", events_.on_close);
        tr->reader_idle().set();
    }

    void on_data(std::string_view chunk)
    {
        emit("receive", events_.on_receive, chunk);
        touch();

        auto split = inbound_.feed(chunk);
        auto overflow = split.overflow.begin();
        for (std::size_t i = 0; i <= split.lines.size(); ++i)
        {
            for (; overflow != split.overflow.end() && overflow->before == i; ++overflow)
                drop_oversized(*overflow);
            if (i == split.lines.size())
                break;

            SMTPCHAN_TRACE_RECV("SMTP", split.lines[i]);
            reply_line line = reply_line::parse(std::move(split.lines[i]));
            emit("reply", events_.on_reply, std::string_view(line.text), line.info());
            correlator_.deliver(std::move(line));
        }
    }

    /// The command awaiting the block fails; it still absorbs the rest of the block.
    void drop_oversized(const net::overflow_line& dropped)
    {
        detail::error_detail detail;
        detail.add("code", smtp::parse_reply_code(dropped.head));
        detail.add_int("max_line_length", inbound_.max_line_length());
        auto err = make_error(errc::line_too_long, "Reply line exceeds the maximum length.", detail.str());
        SMTPCHAN_WARN("smtpchan: oversized reply line dropped");
        emit_error(err);
        correlator_.fail_head(err, smtp::is_terminal_reply(dropped.head));
    }

    /// Forget the transport after the peer went away or the socket failed.
    void teardown(const error_info& err)
    {
        auto tr = std::exchange(transport_, nullptr);
        ++generation_;
        state_ = channel_state::disconnected;
        secure_ = false;
        stop_idle_timer();
        if (tr)
            tr->destroy();
        correlator_.reject_all(err);
    }

    awaitable<void> transmit(std::shared_ptr<byte_source> source, std::shared_ptr<pending_command> cmd,
        std::shared_ptr<net::transport> tr, std::uint64_t gen)
    {
        auto lock = co_await write_mutex_.lock();
        bool sent_any = false;
        for (;;)
        {
            if (gen != generation_)
                co_return;

            auto chunk = co_await source->next();
            if (gen != generation_)
                co_return;
            if (!chunk)
            {
                source_failed(chunk.error(), cmd, sent_any);
                co_return;
            }
            if (!chunk->has_value())
                break;

            std::string bytes = std::move(**chunk);
            if (bytes.empty())
                continue;

            trace_command(bytes);
            emit("send", events_.on_send, std::string_view(bytes));

            smtpchan::asio::error_code ec;
            co_await smtpchan::asio::async_write(tr->stream(), smtpchan::asio::buffer(bytes),
                smtpchan::asio::redirect_error(smtpchan::asio::use_awaitable, ec));
            if (gen != generation_)
                co_return;
            if (ec)
            {
                auto err = net::make_net_error(net::io_stage::write, ec, tr->host(), tr->port());
                SMTPCHAN_WARN("smtpchan: write failed: " + err.to_string());
                emit_error(err);
                correlator_.reject_all(err);
                co_return;
            }
            sent_any = true;
            touch();
        }
    }

    void source_failed(const error_info& err, const std::shared_ptr<pending_command>& cmd, bool sent_any)
    {
        SMTPCHAN_WARN("smtpchan: payload source failed: " + err.to_string());
        if (!sent_any)
        {
            if (!correlator_.withdraw(cmd, err))
                SMTPCHAN_DEBUG("smtpchan: failed payload belonged to a settled command");
            return;
        }

        // The server holds a partial command, so no later reply can be matched.
        emit_error(err);
        teardown(err);
    }

    void trace_command(std::string_view bytes)
    {
        auto split = outbound_.feed(bytes);
        if (split.dropped > 0)
            SMTPCHAN_DEBUG("smtpchan: oversized command line not traced");
        for (const auto& line : split.lines)
        {
            emit("command", events_.on_command, std::string_view(line));
            if (config_.redact_secrets_in_trace)
                SMTPCHAN_TRACE_SEND("SMTP", detail::redact_line(line));
            else
                SMTPCHAN_TRACE_SEND("SMTP", line);
        }
    }

    awaitable<void> run_upgrade(std::shared_ptr<net::transport> tr, std::uint64_t gen, upgrade_options options,
        std::shared_ptr<upgrade_job> job)
    {
        job->outcome = co_await upgrade(std::move(tr), gen, std::move(options));
        job->done.set();
    }

    awaitable<result<void>> upgrade(std::shared_ptr<net::transport> tr, std::uint64_t gen, upgrade_options options)
    {
        auto lock = co_await write_mutex_.lock();
        if (gen != generation_)
            co_return fail<void>(errc::connection_closed, "Connection closed during TLS upgrade.");

        tr->detaching(true);
        tr->stream().cancel();
        co_await tr->reader_idle().wait();
        if (gen != generation_)
            co_return fail<void>(errc::connection_closed, "Connection closed during TLS upgrade.");

        const net::tls_options& tls = options.tls.has_value() ? *options.tls : config_.tls;
        const std::string& sni = options.sni.empty() ? config_.sni : options.sni;
        auto handshake = co_await handshake_tls(*tr, options.tls_context, tls, sni);
        if (gen != generation_)
            co_return fail<void>(errc::connection_closed, "Connection closed during TLS upgrade.");
        if (!handshake)
        {
            SMTPCHAN_WARN("smtpchan: TLS upgrade failed: " + handshake.error().to_string());
            emit_error(handshake.error());
            co_return handshake;
        }

        secure_ = true;
        state_ = channel_state::connected;
        SMTPCHAN_INFO("smtpchan: connection upgraded to TLS");
        start_reader(tr, gen);
        touch();
        co_return ok();
    }

    void touch()
    {
        if (config_.inactivity_timeout.count() <= 0 || !transport_)
            return;
        idle_timer_.expires_after(config_.inactivity_timeout);
    }

    void stop_idle_timer()
    {
        smtpchan::asio::error_code ignored;
        idle_timer_.cancel(ignored);
    }

    void start_idle_watcher(std::uint64_t gen)
    {
        if (config_.inactivity_timeout.count() <= 0)
            return;
        touch();
        smtpchan::asio::co_spawn(executor_, watch_idle(gen), smtpchan::asio::detached);
    }

    awaitable<void> watch_idle(std::uint64_t gen)
    {
        for (;;)
        {
            smtpchan::asio::error_code ec;
            co_await idle_timer_.async_wait(smtpchan::asio::redirect_error(smtpchan::asio::use_awaitable, ec));
            if (gen != generation_)
                co_return;
            // Re-armed by traffic while the wait was completing.
            if (ec == smtpchan::asio::error::operation_aborted || idle_timer_.expiry() > std::chrono::steady_clock::now())
                continue;

            idle_timer_.expires_at(time_point::max());
            SMTPCHAN_INFO("smtpchan: connection idle, sending QUIT");
            emit("timeout", events_.on_timeout);
            smtpchan::asio::co_spawn(executor_, quit_after_idle(), smtpchan::asio::detached);
        }
    }

    awaitable<void> quit_after_idle()
    {
        auto res = co_await write(std::string("QUIT\r\n"));
        if (!res)
            SMTPCHAN_DEBUG("smtpchan: QUIT after inactivity failed: " + res.error().to_string());
    }

    executor_type executor_;
    channel_config config_;
    channel_events events_;
    channel_state state_{channel_state::disconnected};
    std::shared_ptr<net::transport> transport_;
    bool secure_{false};
    net::line_splitter inbound_;
    net::line_splitter outbound_;
    command_correlator correlator_;
    detail::async_mutex write_mutex_;
    smtpchan::asio::steady_timer idle_timer_;
    std::uint64_t generation_{0};
    std::shared_ptr<ssl::context> tls_context_;
};

} // namespace smtpchan::smtp
