/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The channel never throws for I/O or protocol failures; every operation
returns result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <smtpchan/detail/asio_decl.hpp>

namespace smtpchan
{

/// Error categories for smtpchan operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Network (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_io_failed = 102,
    net_eof = 103,
    net_connection_refused = 104,
    net_connection_reset = 105,
    net_timeout = 106,
    net_cancelled = 107,

    // TLS (200-299)
    tls_handshake_failed = 200,
    tls_verify_failed = 201,
    tls_config_failed = 202,

    // Channel (300-399)
    timeout = 300,
    connection_closed = 301,
    handler_failed = 302,
    not_connected = 303,
    invalid_state = 304,
    line_too_long = 305,
    source_failed = 306,

    // Caller input (700-799)
    invalid_argument = 700,

    internal_error = 900,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_eof: return "net_eof";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_timeout: return "net_timeout";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::tls_config_failed: return "tls_config_failed";
        case errc::timeout: return "timeout";
        case errc::connection_closed: return "connection_closed";
        case errc::handler_failed: return "handler_failed";
        case errc::not_connected: return "not_connected";
        case errc::invalid_state: return "invalid_state";
        case errc::line_too_long: return "line_too_long";
        case errc::source_failed: return "source_failed";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// True for failures reported by the socket or the TLS layer.
[[nodiscard]] constexpr bool is_transport_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 300;
}

struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    asio::error_code sys;
    std::source_location where;

    [[nodiscard]] std::string to_string() const
    {
        std::string out;
        out.reserve(message.size() + detail.size() + 32);
        out += '[';
        out += smtpchan::to_string(code);
        out += "] ";
        out += message.empty() ? std::string(smtpchan::to_string(code)) : message;
        if (sys)
        {
            out += " (";
            out += sys.message();
            out += ')';
        }
        return out;
    }
};

template<class T>
using result = std::expected<T, error_info>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    asio::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

template<class T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<class T = void>
[[nodiscard]] result<T> fail(error_info info)
{
    return std::unexpected(std::move(info));
}

template<class T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    asio::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

} // namespace smtpchan
