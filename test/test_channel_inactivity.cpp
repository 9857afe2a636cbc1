/*

test_channel_inactivity.cpp
---------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE channel_inactivity_test

#include <chrono>
#include <string>
#include <boost/test/unit_test.hpp>
#include <smtpchan/detail/async_event.hpp>
#include <smtpchan/smtp/channel.hpp>
#include "test_server.hpp"

using smtpchan::smtp::channel;
using smtpchan::smtp::channel_config;
using smtpchan::smtp::channel_state;
using namespace smtpchan_test;
using namespace std::chrono_literals;


BOOST_AUTO_TEST_CASE(idle_connection_sends_quit)
{
    scripted_server server;
    std::string received;
    server.run([&](tcp::acceptor& acc)
    {
        tcp::socket sock = acc.accept();
        line_reader<tcp::socket> reader(sock);
        send(sock, "220 mx.test ESMTP ready\r\n");
        received = reader.read_line();
        send(sock, "221 2.0.0 Bye\r\n");
        sock.shutdown(tcp::socket::shutdown_both);
        sock.close();
    });

    asio::io_context ctx;
    channel_config cfg;
    cfg.host = "127.0.0.1";
    cfg.port = server.port();
    cfg.inactivity_timeout = 100ms;
    channel chan(ctx, cfg);

    smtpchan::detail::async_event closed(ctx.get_executor());
    int timeout_events = 0;
    std::string last_command;
    chan.events().on_timeout = [&] { ++timeout_events; };
    chan.events().on_command = [&](std::string_view line) { last_command = line; };
    chan.events().on_close = [&] { closed.set(); };

    const auto started = std::chrono::steady_clock::now();
    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        BOOST_REQUIRE(greeting);

        const bool done = co_await closed.wait_until(std::chrono::steady_clock::now() + 5s);
        BOOST_REQUIRE(done);
        BOOST_CHECK_EQUAL(chan.state(), channel_state::disconnected);
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());
    BOOST_CHECK_EQUAL(timeout_events, 1);
    BOOST_CHECK_EQUAL(received, "QUIT");
    BOOST_CHECK_EQUAL(last_command, "QUIT");
    BOOST_TEST((std::chrono::steady_clock::now() - started >= 100ms));
}

BOOST_AUTO_TEST_CASE(traffic_postpones_inactivity)
{
    scripted_server server;
    std::string first;
    std::string second;
    server.run([&](tcp::acceptor& acc)
    {
        tcp::socket sock = acc.accept();
        line_reader<tcp::socket> reader(sock);
        send(sock, "220 mx.test ESMTP ready\r\n");
        first = reader.read_line();
        send(sock, "250 2.0.0 OK\r\n");
        second = reader.read_line();
        send(sock, "221 2.0.0 Bye\r\n");
        reader.wait_eof();
    });

    asio::io_context ctx;
    channel_config cfg;
    cfg.host = "127.0.0.1";
    cfg.port = server.port();
    cfg.inactivity_timeout = 150ms;
    channel chan(ctx, cfg);

    smtpchan::detail::async_event timed_out(ctx.get_executor());
    int timeout_events = 0;
    chan.events().on_timeout = [&] { ++timeout_events; timed_out.set(); };

    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        BOOST_REQUIRE(greeting);

        asio::steady_timer wait(ctx, 80ms);
        co_await wait.async_wait(asio::use_awaitable);
        auto noop = co_await chan.write(std::string("NOOP\r\n"));
        BOOST_REQUIRE(noop);
        BOOST_CHECK_EQUAL(timeout_events, 0);

        const bool fired = co_await timed_out.wait_until(std::chrono::steady_clock::now() + 5s);
        BOOST_REQUIRE(fired);
        BOOST_CHECK_EQUAL(timeout_events, 1);

        // Let the automatic QUIT get its reply before closing.
        asio::steady_timer settle(ctx, 50ms);
        co_await settle.async_wait(asio::use_awaitable);
        auto closed = co_await chan.close();
        BOOST_REQUIRE(closed);
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());
    BOOST_CHECK_EQUAL(first, "NOOP");
    BOOST_CHECK_EQUAL(second, "QUIT");
}
