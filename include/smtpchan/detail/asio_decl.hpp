/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / standalone Asio declarations for smtpchan.
Everything else in the library spells Asio types through smtpchan::asio.

*/

#pragma once

#include <chrono>

#if defined(SMTPCHAN_USE_STANDALONE_ASIO)

#include <asio/version.hpp>
#if ASIO_VERSION < 101800 // Asio 1.18.0
#error "Asio version 1.18.0 or higher is required"
#endif

#include <asio.hpp>
#include <asio/ssl.hpp>

#if defined(ASIO_HAS_CO_AWAIT)

namespace smtpchan::asio
{
    // Core types
    using ::asio::awaitable;
    using ::asio::buffer;
    using ::asio::co_spawn;
    using ::asio::detached;
    using ::asio::post;
    using ::asio::use_awaitable;
    using ::asio::use_future;
    using ::asio::redirect_error;
    using ::asio::io_context;
    using ::asio::any_io_executor;
    using ::asio::steady_timer;
    using ::asio::streambuf;
    namespace this_coro = ::asio::this_coro;

    // IP networking
    namespace ip = ::asio::ip;
    using tcp = ::asio::ip::tcp;

    // Async operations
    using ::asio::async_write;
    using ::asio::async_read;
    using ::asio::async_read_until;
    using ::asio::read_until;
    using ::asio::read;
    using ::asio::write;

    namespace ssl = ::asio::ssl;
    namespace error = ::asio::error;

    using error_code = ::asio::error_code;
    using system_error = ::asio::system_error;

} // namespace smtpchan::asio

#else
#error "smtpchan requires coroutine support (C++20) and Asio 1.18+"
#endif

#else // Use Boost.Asio (default)

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_future.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)

namespace smtpchan::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::post;
    using boost::asio::use_awaitable;
    using boost::asio::use_future;
    using boost::asio::redirect_error;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::streambuf;
    namespace this_coro = boost::asio::this_coro;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_read;
    using boost::asio::async_read_until;
    using boost::asio::read_until;
    using boost::asio::read;
    using boost::asio::write;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace smtpchan::asio

#else
#error "smtpchan requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

#endif // SMTPCHAN_USE_STANDALONE_ASIO

namespace smtpchan
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
