/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and smtpchan::errc for network I/O.

*/

#pragma once

#include <string_view>

#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/error_detail.hpp>
#include <smtpchan/detail/result.hpp>

namespace smtpchan::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const smtpchan::asio::error_code& ec) noexcept
{
    namespace error = smtpchan::asio::error;

    if (ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(std::string_view host, unsigned short port, io_stage stage)
{
    detail::error_detail detail;
    detail.add("proto", "SMTP");
    detail.add("host", host);
    detail.add_int("port", port);
    detail.add("stage", stage_name(stage));
    return detail;
}

/// Error for a failed socket operation, carrying the Asio code verbatim in `sys`.
[[nodiscard]] inline error_info make_net_error(io_stage stage, const smtpchan::asio::error_code& ec,
    std::string_view host, unsigned short port,
    std::source_location where = std::source_location::current())
{
    auto detail = make_net_detail(host, port, stage);
    detail.add_ec("sys", ec);
    std::string message = "Network ";
    message += stage_name(stage);
    message += " failed.";
    return make_error(map_net_error(stage, ec), std::move(message), detail.str(), ec, where);
}

} // namespace smtpchan::net
