#pragma once

#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/net/tls_options.hpp>

namespace smtpchan::net
{

/**
Configure the TLS trust store for a context.
**/
inline result<void> configure_trust_store(smtpchan::asio::ssl::context& ctx, const tls_options& options)
{
    if (options.verify == verify_mode::none)
        return ok();

    smtpchan::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_config_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail<void>(errc::tls_config_failed, "TLS trust store configuration failed.", "ca_file=" + file, ec);
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail<void>(errc::tls_config_failed, "TLS trust store configuration failed.", "ca_path=" + path, ec);
    }
    return ok();
}

} // namespace smtpchan::net
