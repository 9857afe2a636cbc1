/*

throwing.hpp
------------

Turns smtpchan::result into exceptions for callers who would rather write
`auto code = unwrap(co_await chan.write("NOOP\r\n"));`.

*/

#pragma once

#include <stdexcept>
#include <utility>

#include <smtpchan/config.hpp>
#include <smtpchan/detail/result.hpp>

namespace smtpchan
{

#if !SMTPCHAN_THROWING_ENABLED
#error "SMTPCHAN_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(info.to_string()),
          info_(std::move(info))
    {
    }

    [[nodiscard]] errc code() const noexcept { return info_.code; }
    [[nodiscard]] const error_info& info() const noexcept { return info_; }

private:
    error_info info_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace smtpchan
