/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <openssl/ssl.h>

namespace smtpchan::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
    bool allow_self_signed = false;
    bool allow_expired = false;

    /// Encrypt without authenticating the server (test rigs, local relays).
    static tls_options insecure()
    {
        tls_options opt;
        opt.verify = verify_mode::none;
        opt.verify_host = false;
        opt.use_default_verify_paths = false;
        return opt;
    }
};

} // namespace smtpchan::net
