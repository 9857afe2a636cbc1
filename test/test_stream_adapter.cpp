/*

test_stream_adapter.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE stream_adapter_test

#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/test/unit_test.hpp>
#include <smtpchan/smtp/stream_adapter.hpp>

namespace asio = smtpchan::asio;
using smtpchan::smtp::byte_source;
using smtpchan::smtp::istream_source;
using smtpchan::smtp::payload;
using smtpchan::smtp::pull_source;
using smtpchan::smtp::to_byte_source;

namespace
{

// Concatenates every chunk of `source`; fails the test on a source error.
std::string drain(std::shared_ptr<byte_source> source, std::size_t* chunks = nullptr)
{
    asio::io_context ctx;
    auto fut = asio::co_spawn(ctx, [source, chunks]() -> asio::awaitable<std::string>
    {
        std::string out;
        for (;;)
        {
            auto chunk = co_await source->next();
            BOOST_REQUIRE(chunk);
            if (!chunk->has_value())
                break;
            if (chunks != nullptr)
                ++*chunks;
            out += **chunk;
        }
        co_return out;
    }, asio::use_future);
    ctx.run();
    return fut.get();
}

} // namespace


BOOST_AUTO_TEST_CASE(string_payload_is_one_chunk)
{
    std::size_t chunks = 0;
    BOOST_CHECK_EQUAL(drain(to_byte_source(payload(std::string("EHLO localhost\r\n"))), &chunks),
        "EHLO localhost\r\n");
    BOOST_CHECK_EQUAL(chunks, 1u);
}

BOOST_AUTO_TEST_CASE(source_payload_passes_through)
{
    auto source = std::make_shared<pull_source>([n = 0]() mutable -> std::optional<std::string>
    {
        if (n == 3)
            return std::nullopt;
        return std::string(1, static_cast<char>('a' + n++));
    });
    auto adapted = to_byte_source(payload(std::static_pointer_cast<byte_source>(source)));
    BOOST_TEST(adapted.get() == source.get());

    std::size_t chunks = 0;
    BOOST_CHECK_EQUAL(drain(adapted, &chunks), "abc");
    BOOST_CHECK_EQUAL(chunks, 3u);
}

BOOST_AUTO_TEST_CASE(null_source_is_empty_payload)
{
    BOOST_CHECK_EQUAL(drain(to_byte_source(payload(std::shared_ptr<byte_source>()))), "");
}

BOOST_AUTO_TEST_CASE(istream_source_reads_in_chunks)
{
    std::istringstream in("MAIL FROM:<a@example.com>\r\n");
    std::size_t chunks = 0;
    BOOST_CHECK_EQUAL(drain(std::make_shared<istream_source>(in, 10), &chunks), "MAIL FROM:<a@example.com>\r\n");
    BOOST_CHECK_EQUAL(chunks, 3u);
}

BOOST_AUTO_TEST_CASE(throwing_producer_is_an_error)
{
    pull_source source([]() -> std::optional<std::string> { throw std::runtime_error("disk gone"); });
    asio::io_context ctx;
    auto fut = asio::co_spawn(ctx, source.next(), asio::use_future);
    ctx.run();
    auto res = fut.get();
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == smtpchan::errc::source_failed);
    BOOST_TEST(res.error().detail == "disk gone");
}
