#include <iostream>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <smtpchan/smtpchan.hpp>
#include "example_util.hpp"

using smtpchan::unwrap;
using smtpchan::smtp::channel;
using smtpchan::smtp::channel_config;

boost::asio::awaitable<void> upgrade_session(channel& chan)
{
    try
    {
        unwrap(co_await chan.connect());
        unwrap(co_await chan.write(std::string("EHLO localhost\r\n")));

        auto ready = unwrap(co_await chan.write(std::string("STARTTLS\r\n")));
        if (ready == "220")
        {
            unwrap(co_await chan.negotiate_tls());
            std::cout << "Secure: " << std::boolalpha << chan.is_secure() << std::endl;
            unwrap(co_await chan.write(std::string("EHLO localhost\r\n")));
        }
        else
            std::cerr << "Server refused STARTTLS: " << ready << std::endl;
        unwrap(co_await chan.write(std::string("QUIT\r\n")));
    }
    catch (const smtpchan::exception& exc)
    {
        print_error(exc.info());
    }
    auto closed = co_await chan.close();
    if (!closed)
        print_error(closed.error());
}

int main()
{
    try
    {
        channel_config cfg;
        cfg.host = "smtp.gmail.com";
        cfg.port = 587;
        cfg.tls.use_default_verify_paths = true;
        cfg.tls.verify = smtpchan::net::verify_mode::peer;
        cfg.tls.verify_host = true;
        cfg.tls_context = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);

        boost::asio::io_context io_ctx;
        channel chan(io_ctx, cfg);
        boost::asio::co_spawn(io_ctx, upgrade_session(chan), boost::asio::detached);
        io_ctx.run();
    }
    catch (std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << std::endl;
    }
    return 0;
}
