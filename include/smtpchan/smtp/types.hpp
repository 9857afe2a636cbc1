#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/detail/timeout_config.hpp>
#include <smtpchan/net/line_splitter.hpp>
#include <smtpchan/net/tls_options.hpp>
#include <smtpchan/net/transport.hpp>

namespace smtpchan
{
namespace smtp
{

using duration = std::chrono::steady_clock::duration;
using net::address_family;

/// First three characters of a reply line; empty when the line is shorter.
[[nodiscard]] inline std::string parse_reply_code(std::string_view line)
{
    if (line.size() < 3)
        return std::string();
    return std::string(line.substr(0, 3));
}

/// `250 OK` ends a reply block, `250-SIZE` continues it.
[[nodiscard]] inline bool is_terminal_reply(std::string_view line) noexcept
{
    return line.size() >= 4 && line[3] == ' ';
}

struct reply_info
{
    std::string code;
    bool is_terminal = false;
};

struct reply_line
{
    std::string text;
    std::string code;
    bool is_terminal = false;

    static reply_line parse(std::string text)
    {
        reply_line line;
        line.code = parse_reply_code(text);
        line.is_terminal = is_terminal_reply(text);
        line.text = std::move(text);
        return line;
    }

    [[nodiscard]] reply_info info() const
    {
        return reply_info{code, is_terminal};
    }
};

/// Called once per reply line of the command's block, in arrival order.
using line_handler = std::function<void(std::string_view line, const reply_info& info)>;

struct command_options
{
    line_handler handler;

    /// Unset falls back to timeout_config; zero means no deadline.
    std::optional<duration> timeout;
};

struct close_options
{
    std::optional<duration> timeout;
};

struct upgrade_options
{
    /// Replaces channel_config::tls for this handshake only.
    std::optional<net::tls_options> tls;
    std::string sni;
    std::shared_ptr<smtpchan::asio::ssl::context> tls_context;
    std::optional<duration> timeout;
};

struct channel_config
{
    std::string host = "localhost";
    unsigned short port = 25;
    std::string local_address;
    unsigned short local_port = 0;
    address_family family = address_family::unspecified;

    /// Idle time after which the channel sends QUIT by itself; zero disables.
    std::chrono::milliseconds inactivity_timeout{0};

    /// Implicit TLS from the first byte (port 465 style).
    bool encrypted = false;
    net::tls_options tls;
    std::string sni;
    std::shared_ptr<smtpchan::asio::ssl::context> tls_context;

    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;
    timeout_config timeouts;
    bool redact_secrets_in_trace = true;

    [[nodiscard]] net::endpoint_config endpoint() const
    {
        return net::endpoint_config{host, port, local_address, local_port, family};
    }
};

/**
Observer callbacks. Every member is optional.

They run on the channel's executor. One that throws is logged and otherwise ignored.
**/
struct channel_events
{
    std::function<void()> on_connect;
    std::function<void()> on_close;
    std::function<void()> on_end;
    std::function<void()> on_timeout;
    std::function<void(const error_info&)> on_error;
    std::function<void(std::string_view line, const reply_info& info)> on_reply;
    std::function<void(std::string_view line)> on_command;
    std::function<void(std::string_view chunk)> on_send;
    std::function<void(std::string_view chunk)> on_receive;
};

} // namespace smtp
} // namespace smtpchan
