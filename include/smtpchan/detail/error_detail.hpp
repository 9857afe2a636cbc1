/*

error_detail.hpp
----------------

Builds the structured `detail` string carried by error_info.
Each entry is formatted as key=value\n to ease parsing.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include <smtpchan/detail/asio_decl.hpp>

namespace smtpchan::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, const asio::error_code& ec)
    {
        append_key(key);
        append_int(static_cast<std::uint64_t>(ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            out_.append(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace smtpchan::detail
