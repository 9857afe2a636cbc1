/*

line_splitter.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace smtpchan::net
{

/// Default maximum line length (RFC 5321 allows 512 for replies, 998 for text lines; leave headroom)
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/// A line discarded for exceeding the maximum length.
struct overflow_line
{
    /// Index in `split_result::lines` the discarded line preceded.
    std::size_t before = 0;

    /// First bytes of the line, enough to read its reply code and separator.
    std::string head;
};

struct split_result
{
    /// Complete lines, terminator stripped, in arrival order.
    std::vector<std::string> lines;

    /// Lines dropped for exceeding the maximum length.
    std::size_t dropped = 0;

    /// Where each dropped line sat among `lines`, in arrival order.
    std::vector<overflow_line> overflow;
};

/**
Turns arbitrary byte chunks into protocol lines.

A line ends at LF; a CR right before it is stripped too. The unterminated tail
is kept until a later chunk completes it. A line longer than the maximum is
discarded up to its terminator and counted in `split_result::dropped`.
**/
class line_splitter
{
public:
    explicit line_splitter(std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH)
        : max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH))
    {
    }

    [[nodiscard]] split_result feed(std::string_view chunk)
    {
        split_result out;
        while (!chunk.empty())
        {
            const auto pos = chunk.find('\n');
            if (pos == std::string_view::npos)
            {
                append_tail(chunk, out);
                break;
            }

            append_tail(chunk.substr(0, pos), out);
            chunk.remove_prefix(pos + 1);

            if (discarding_)
            {
                discarding_ = false;
                tail_.clear();
                continue;
            }
            if (!tail_.empty() && tail_.back() == '\r')
                tail_.pop_back();
            if (tail_.size() > max_line_length_)
            {
                record_overflow(out);
                tail_.clear();
                continue;
            }
            out.lines.push_back(std::move(tail_));
            tail_.clear();
        }
        return out;
    }

    /// Bytes received after the last complete line.
    [[nodiscard]] std::string_view pending() const noexcept
    {
        return tail_;
    }

    void reset() noexcept
    {
        tail_.clear();
        discarding_ = false;
    }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

private:
    void append_tail(std::string_view part, split_result& out)
    {
        if (discarding_)
            return;
        tail_.append(part.data(), part.size());
        // One extra byte of slack for the CR of a CRLF terminator.
        if (tail_.size() > max_line_length_ + 1)
        {
            record_overflow(out);
            tail_.clear();
            discarding_ = true;
        }
    }

    void record_overflow(split_result& out)
    {
        ++out.dropped;
        out.overflow.push_back(overflow_line{out.lines.size(), tail_.substr(0, 4)});
    }

    std::string tail_;
    std::size_t max_line_length_;
    bool discarding_{false};
};

} // namespace smtpchan::net
