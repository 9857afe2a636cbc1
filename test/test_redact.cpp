/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <smtpchan/detail/redact.hpp>

using smtpchan::detail::redact_line;


BOOST_AUTO_TEST_CASE(redact_auth_plain)
{
    BOOST_TEST(redact_line("AUTH PLAIN AHVzZXIAc2VjcmV0") == "AUTH PLAIN <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_auth_keeps_terminator)
{
    BOOST_TEST(redact_line("auth xoauth2 dXNlcj1mb28BYXV0aD1CZWFyZXIgdG9rZW4BAQ==\r\n") == "auth xoauth2 <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(auth_without_response_unchanged)
{
    BOOST_TEST(redact_line("AUTH LOGIN") == "AUTH LOGIN");
}

BOOST_AUTO_TEST_CASE(redact_login_continuation)
{
    BOOST_TEST(redact_line("c2VjcmV0cGFzc3dvcmQ=") == "<redacted>");
}

BOOST_AUTO_TEST_CASE(plain_commands_unchanged)
{
    BOOST_TEST(redact_line("EHLO client.example.com") == "EHLO client.example.com");
    BOOST_TEST(redact_line("QUIT") == "QUIT");
    BOOST_TEST(redact_line("DATA\r\n") == "DATA\r\n");
    BOOST_TEST(redact_line("MAIL FROM:<a@example.com>") == "MAIL FROM:<a@example.com>");
}
