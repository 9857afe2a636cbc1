/*

test_channel_starttls.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Upgrades a live channel to TLS against a server using a throwaway self-signed
certificate, and checks that reply correlation carries on over the new layer.

*/


#define BOOST_TEST_MODULE channel_starttls_test

#include <chrono>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <smtpchan/smtp/channel.hpp>
#include "test_server.hpp"

using smtpchan::errc;
using smtpchan::net::tls_options;
using smtpchan::smtp::channel;
using smtpchan::smtp::channel_config;
using smtpchan::smtp::channel_state;
using smtpchan::smtp::command_options;
using smtpchan::smtp::reply_info;
using smtpchan::smtp::upgrade_options;
using namespace smtpchan_test;

namespace
{

channel_config loopback(unsigned short port)
{
    channel_config cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    return cfg;
}

command_options collect_into(std::vector<std::string>& lines)
{
    command_options opts;
    opts.handler = [&lines](std::string_view line, const reply_info&) { lines.emplace_back(line); };
    return opts;
}

using tls_socket = ssl::stream<tcp::socket>;

} // namespace


BOOST_AUTO_TEST_CASE(starttls_upgrade_keeps_correlation)
{
    ssl::context server_tls(ssl::context::tls_server);
    use_self_signed_certificate(server_tls);

    scripted_server server;
    std::vector<std::string> received;
    server.run([&](tcp::acceptor& acc)
    {
        tcp::socket sock = acc.accept();
        {
            line_reader<tcp::socket> plain(sock);
            send(sock, "220 mx.test ESMTP ready\r\n");
            received.push_back(plain.read_line());
            send(sock, "250-mx.test Hello\r\n250-SIZE 10000000\r\n250-8BITMIME\r\n250-STARTTLS\r\n250 HELP\r\n");
            received.push_back(plain.read_line());
            send(sock, "220 2.0.0 Ready to start TLS\r\n");
        }

        tls_socket tls(std::move(sock), server_tls);
        tls.handshake(ssl::stream_base::server);
        line_reader<tls_socket> secure(tls);
        received.push_back(secure.read_line());
        send(tls, "250-mx.test Hello\r\n250-SIZE 10000000\r\n250-8BITMIME\r\n250 HELP\r\n");
        received.push_back(secure.read_line());
        send(tls, "221 2.0.0 Bye\r\n");
        secure.wait_eof();
    });

    asio::io_context ctx;
    auto cfg = loopback(server.port());
    cfg.tls = tls_options::insecure();
    channel chan(ctx, cfg);
    std::vector<std::string> all_replies;
    chan.events().on_reply = [&](std::string_view line, const reply_info&) { all_replies.emplace_back(line); };

    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        BOOST_REQUIRE(greeting);

        std::vector<std::string> ehlo_lines;
        auto ehlo = co_await chan.write(std::string("EHLO localhost\r\n"), collect_into(ehlo_lines));
        BOOST_REQUIRE(ehlo);
        BOOST_CHECK_EQUAL(ehlo_lines.size(), 5u);

        auto starttls = co_await chan.write(std::string("STARTTLS\r\n"));
        BOOST_REQUIRE(starttls);
        BOOST_CHECK_EQUAL(*starttls, "220");

        auto upgraded = co_await chan.negotiate_tls();
        if (!upgraded)
            BOOST_FAIL(upgraded.error().to_string());
        BOOST_TEST(chan.is_secure());
        BOOST_CHECK_EQUAL(chan.state(), channel_state::connected);

        std::vector<std::string> lines;
        auto again = co_await chan.write(std::string("EHLO localhost\r\n"), collect_into(lines));
        BOOST_REQUIRE(again);
        BOOST_CHECK_EQUAL(*again, "250");
        BOOST_REQUIRE_EQUAL(lines.size(), 4u);
        for (const auto& line : lines)
            BOOST_TEST(line.find("STARTTLS") == std::string::npos);

        auto twice = co_await chan.negotiate_tls();
        BOOST_REQUIRE(!twice);
        BOOST_CHECK_EQUAL(twice.error().code, errc::invalid_state);

        auto quit = co_await chan.write(std::string("QUIT\r\n"));
        BOOST_REQUIRE(quit);
        BOOST_CHECK_EQUAL(*quit, "221");

        auto closed = co_await chan.close();
        BOOST_REQUIRE(closed);
        BOOST_TEST(!chan.is_secure());
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());

    const std::vector<std::string> expected_commands{"EHLO localhost", "STARTTLS", "EHLO localhost", "QUIT"};
    BOOST_TEST(received == expected_commands, boost::test_tools::per_element());
    BOOST_CHECK_EQUAL(all_replies.size(), 1u + 5u + 1u + 4u + 1u);
}

BOOST_AUTO_TEST_CASE(self_signed_certificate_rejected_when_verifying)
{
    ssl::context server_tls(ssl::context::tls_server);
    use_self_signed_certificate(server_tls);

    scripted_server server;
    server.run([&](tcp::acceptor& acc)
    {
        tcp::socket sock = acc.accept();
        {
            line_reader<tcp::socket> plain(sock);
            send(sock, "220 mx.test ESMTP ready\r\n");
            (void)plain.read_line();
            send(sock, "220 2.0.0 Ready to start TLS\r\n");
        }
        tls_socket tls(std::move(sock), server_tls);
        asio::error_code ec;
        tls.handshake(ssl::stream_base::server, ec);
        line_reader<tls_socket>(tls).wait_eof();
    });

    asio::io_context ctx;
    channel chan(ctx, loopback(server.port()));
    std::vector<errc> errors;
    chan.events().on_error = [&](const smtpchan::error_info& err) { errors.push_back(err.code); };

    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        BOOST_REQUIRE(greeting);
        auto starttls = co_await chan.write(std::string("STARTTLS\r\n"));
        BOOST_REQUIRE(starttls);

        upgrade_options opts;
        tls_options strict;
        strict.use_default_verify_paths = false;
        opts.tls = strict;
        opts.sni = "localhost";
        auto upgraded = co_await chan.negotiate_tls(std::move(opts));
        BOOST_REQUIRE(!upgraded);
        BOOST_TEST(smtpchan::is_transport_error(upgraded.error().code));
        BOOST_TEST(!chan.is_secure());
        BOOST_CHECK_EQUAL(chan.state(), channel_state::upgrading);

        auto blocked = co_await chan.write(std::string("NOOP\r\n"));
        BOOST_REQUIRE(!blocked);
        BOOST_CHECK_EQUAL(blocked.error().code, errc::invalid_state);

        auto closed = co_await chan.close();
        BOOST_REQUIRE(closed);
        BOOST_CHECK_EQUAL(chan.state(), channel_state::disconnected);
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());
    BOOST_REQUIRE_EQUAL(errors.size(), 1u);
    BOOST_TEST(smtpchan::is_transport_error(errors.front()));
}

BOOST_AUTO_TEST_CASE(implicit_tls_from_first_byte)
{
    ssl::context server_tls(ssl::context::tls_server);
    use_self_signed_certificate(server_tls);

    scripted_server server;
    std::string received;
    server.run([&](tcp::acceptor& acc)
    {
        tls_socket tls(acc.accept(), server_tls);
        tls.handshake(ssl::stream_base::server);
        line_reader<tls_socket> reader(tls);
        send(tls, "220 mx.test ESMTP ready\r\n");
        received = reader.read_line();
        send(tls, "250 2.0.0 OK\r\n");
        reader.wait_eof();
    });

    asio::io_context ctx;
    auto cfg = loopback(server.port());
    cfg.encrypted = true;
    cfg.tls = tls_options::insecure();
    channel chan(ctx, cfg);

    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        if (!greeting)
            BOOST_FAIL(greeting.error().to_string());
        BOOST_CHECK_EQUAL(*greeting, "220");
        BOOST_TEST(chan.is_secure());

        auto upgrade = co_await chan.negotiate_tls();
        BOOST_REQUIRE(!upgrade);
        BOOST_CHECK_EQUAL(upgrade.error().code, errc::invalid_state);

        auto noop = co_await chan.write(std::string("NOOP\r\n"));
        BOOST_REQUIRE(noop);
        BOOST_CHECK_EQUAL(*noop, "250");

        auto closed = co_await chan.close();
        BOOST_REQUIRE(closed);
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());
    BOOST_CHECK_EQUAL(received, "NOOP");
}

BOOST_AUTO_TEST_CASE(stalled_handshake_hits_upgrade_deadline)
{
    scripted_server server;
    server.run([](tcp::acceptor& acc)
    {
        tcp::socket sock = acc.accept();
        line_reader<tcp::socket> plain(sock);
        send(sock, "220 mx.test ESMTP ready\r\n");
        (void)plain.read_line();
        send(sock, "220 2.0.0 Ready to start TLS\r\n");
        // Swallows the ClientHello and never answers it.
        plain.wait_eof();
    });

    asio::io_context ctx;
    auto cfg = loopback(server.port());
    cfg.tls = tls_options::insecure();
    channel chan(ctx, cfg);

    auto fut = asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
    {
        auto greeting = co_await chan.connect();
        BOOST_REQUIRE(greeting);
        auto starttls = co_await chan.write(std::string("STARTTLS\r\n"));
        BOOST_REQUIRE(starttls);

        upgrade_options opts;
        opts.timeout = std::chrono::milliseconds(100);
        auto upgraded = co_await chan.negotiate_tls(std::move(opts));
        BOOST_REQUIRE(!upgraded);
        BOOST_CHECK_EQUAL(upgraded.error().code, errc::timeout);
        BOOST_TEST(!chan.is_secure());
        BOOST_CHECK_EQUAL(chan.state(), channel_state::upgrading);

        auto closed = co_await chan.close();
        BOOST_REQUIRE(closed);
        BOOST_CHECK_EQUAL(chan.state(), channel_state::disconnected);
    }, asio::use_future);

    ctx.run();
    fut.get();
    server.join();
    BOOST_TEST(server.error().empty());
}
