/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/async_event.hpp>
#include <smtpchan/detail/log.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/net/error_mapping.hpp>
#include <smtpchan/net/upgradable_stream.hpp>

namespace smtpchan::net
{

enum class address_family
{
    unspecified,
    v4,
    v6
};

/// Where to connect and which local address to bind first.
struct endpoint_config
{
    std::string host = "localhost";
    unsigned short port = 25;
    std::string local_address;
    unsigned short local_port = 0;
    address_family family = address_family::unspecified;
};

[[nodiscard]] inline bool is_ip_literal(std::string_view host)
{
    smtpchan::asio::error_code ec;
    (void)smtpchan::asio::ip::make_address(std::string(host), ec);
    return !ec;
}

[[nodiscard]] inline bool contains_crlf_or_nul(std::string_view text) noexcept
{
    return text.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos;
}

/**
Server name for the TLS hello.

An explicit name wins; otherwise the host is used unless it is an IP literal, in
which case no name is sent.
**/
[[nodiscard]] inline result<std::string> resolve_sni(std::string_view host, std::string sni)
{
    if (sni.empty() && !is_ip_literal(host))
        sni.assign(host.begin(), host.end());
    if (contains_crlf_or_nul(sni))
        return fail<std::string>(errc::invalid_argument, "Invalid sni: CR/LF or NUL not allowed.");
    return ok(std::move(sni));
}

/**
Resolve the host and connect to the first endpoint that accepts.

Endpoints are tried in resolver order. When a local address or port is given the
socket is bound before connecting. The error of the last failed attempt is
returned.
**/
inline awaitable<result<upgradable_stream>> open_stream(any_io_executor executor, const endpoint_config& cfg)
{
    using smtpchan::asio::redirect_error;
    using smtpchan::asio::use_awaitable;

    if (contains_crlf_or_nul(cfg.host))
        co_return fail<upgradable_stream>(errc::invalid_argument, "Invalid host: CR/LF or NUL not allowed.");

    smtpchan::asio::error_code ec;
    tcp::resolver resolver(executor);
    const std::string service = std::to_string(cfg.port);
    tcp::resolver::results_type endpoints;
    switch (cfg.family)
    {
        case address_family::v4:
            endpoints = co_await resolver.async_resolve(tcp::v4(), cfg.host, service, redirect_error(use_awaitable, ec));
            break;
        case address_family::v6:
            endpoints = co_await resolver.async_resolve(tcp::v6(), cfg.host, service, redirect_error(use_awaitable, ec));
            break;
        case address_family::unspecified:
            endpoints = co_await resolver.async_resolve(cfg.host, service, redirect_error(use_awaitable, ec));
            break;
    }
    if (ec)
        co_return fail<upgradable_stream>(make_net_error(io_stage::resolve, ec, cfg.host, cfg.port));
    if (endpoints.empty())
        co_return fail<upgradable_stream>(errc::net_resolve_failed, "Host resolved to no address.",
            make_net_detail(cfg.host, cfg.port, io_stage::resolve).str());

    smtpchan::asio::ip::address local;
    const bool bind_local = !cfg.local_address.empty() || cfg.local_port != 0;
    if (!cfg.local_address.empty())
    {
        local = smtpchan::asio::ip::make_address(cfg.local_address, ec);
        if (ec)
            co_return fail<upgradable_stream>(errc::invalid_argument, "Invalid local address.",
                "local_address=" + cfg.local_address, ec);
    }

    error_info last_error = make_error(errc::net_connect_failed, "Network connect failed.");
    for (const auto& entry : endpoints)
    {
        const tcp::endpoint remote = entry.endpoint();
        tcp::socket socket(executor);

        socket.open(remote.protocol(), ec);
        if (ec)
        {
            last_error = make_net_error(io_stage::connect, ec, cfg.host, cfg.port);
            continue;
        }

        if (bind_local)
        {
            if (!cfg.local_address.empty() && local.is_v4() != remote.address().is_v4())
                continue;
            const tcp::endpoint local_endpoint = cfg.local_address.empty()
                ? tcp::endpoint(remote.protocol(), cfg.local_port)
                : tcp::endpoint(local, cfg.local_port);
            socket.bind(local_endpoint, ec);
            if (ec)
            {
                last_error = make_net_error(io_stage::connect, ec, cfg.host, cfg.port);
                continue;
            }
        }

        co_await socket.async_connect(remote, redirect_error(use_awaitable, ec));
        if (!ec)
            co_return ok(upgradable_stream(std::move(socket)));

        SMTPCHAN_DEBUG("smtpchan: connect to " + remote.address().to_string() + " failed: " + ec.message());
        last_error = make_net_error(io_stage::connect, ec, cfg.host, cfg.port);
    }
    co_return fail<upgradable_stream>(std::move(last_error));
}

/**
One live connection of a channel.

The reader coroutine and the channel share it. `detaching` asks the reader to
stop after its pending read; `reader_idle` is set whenever no reader runs on
the stream.
**/
class transport
{
public:
    transport(upgradable_stream stream, std::string host, unsigned short port)
        : stream_(std::move(stream)),
          reader_idle_(stream_.get_executor(), true),
          host_(std::move(host)),
          port_(port)
    {
    }

    transport(const transport&) = delete;
    transport& operator=(const transport&) = delete;

    upgradable_stream& stream() noexcept { return stream_; }
    detail::async_event& reader_idle() noexcept { return reader_idle_; }

    bool detaching() const noexcept { return detaching_; }
    void detaching(bool value) noexcept { detaching_ = value; }

    const std::string& host() const noexcept { return host_; }
    unsigned short port() const noexcept { return port_; }

    /// Close the socket; the pending read completes with an error.
    void destroy() noexcept
    {
        stream_.close();
    }

private:
    upgradable_stream stream_;
    detail::async_event reader_idle_;
    bool detaching_{false};
    std::string host_;
    unsigned short port_;
};

} // namespace smtpchan::net
