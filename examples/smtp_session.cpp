#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <smtpchan/smtpchan.hpp>
#include "example_util.hpp"

using smtpchan::smtp::channel;
using smtpchan::smtp::channel_config;
using smtpchan::smtp::command_options;
using smtpchan::smtp::reply_info;

boost::asio::awaitable<void> finish(channel& chan)
{
    auto closed = co_await chan.close();
    if (!closed)
        print_error(closed.error());
}

// Plain session against a local relay: greeting, EHLO, a short message, QUIT.
boost::asio::awaitable<void> run_session(channel& chan)
{
    auto greeting = co_await chan.connect();
    if (!greeting)
    {
        print_error(greeting.error());
        co_return;
    }
    std::cout << "Greeting code: " << *greeting << "\n";

    command_options ehlo;
    ehlo.handler = [](std::string_view line, const reply_info& info)
    {
        std::cout << (info.is_terminal ? "  = " : "  - ") << line << "\n";
    };
    auto code = co_await chan.write(std::string("EHLO localhost\r\n"), std::move(ehlo));
    if (!code)
    {
        print_error(code.error());
        co_await finish(chan);
        co_return;
    }

    const char* script[] = {
        "MAIL FROM:<sender@example.com>\r\n",
        "RCPT TO:<recipient@example.com>\r\n",
        "DATA\r\n",
    };
    for (const char* command : script)
    {
        auto reply = co_await chan.write(std::string(command));
        if (!reply)
        {
            print_error(reply.error());
            co_await finish(chan);
            co_return;
        }
        std::cout << command << " -> " << *reply << "\n";
    }

    // The body goes through an adapter so large messages never sit in one string.
    auto body = std::make_shared<smtpchan::smtp::pull_source>(
        [part = 0]() mutable -> std::optional<std::string>
        {
            switch (part++)
            {
            case 0: return std::string("Subject: smtpchan\r\n\r\n");
            case 1: return std::string("Hello, World!\r\n");
            case 2: return std::string(".\r\n");
            default: return std::nullopt;
            }
        });
    auto accepted = co_await chan.write(body);
    if (accepted)
        std::cout << "Message accepted: " << *accepted << "\n";
    else
        print_error(accepted.error());

    auto bye = co_await chan.write(std::string("QUIT\r\n"));
    if (!bye)
        print_error(bye.error());
    co_await finish(chan);
}

int main(int argc, char* argv[])
{
    channel_config cfg;
    cfg.host = argc > 1 ? argv[1] : "localhost";
    cfg.port = argc > 2 ? static_cast<unsigned short>(std::stoi(argv[2])) : 25;
    cfg.inactivity_timeout = std::chrono::seconds(30);

    smtpchan::log::logger::instance().set_level(smtpchan::log::level::info);
    smtpchan::log::logger::instance().set_trace_enabled(true);

    boost::asio::io_context io_ctx;
    channel chan(io_ctx, cfg);
    chan.events().on_error = [](const smtpchan::error_info& err) { print_error(err); };
    chan.events().on_close = [] { std::cout << "Connection closed.\n"; };

    boost::asio::co_spawn(io_ctx, run_session(chan), boost::asio::detached);
    io_ctx.run();
    return 0;
}
