/*

stream_adapter.hpp
------------------

Pull-style byte sources for channel writes. A command is sent either from a
string held in memory or from a producer yielding chunks until it runs dry.

*/

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <smtpchan/detail/asio_decl.hpp>
#include <smtpchan/detail/result.hpp>

namespace smtpchan
{
namespace smtp
{

struct byte_source
{
    virtual ~byte_source() = default;

    /// Next chunk, std::nullopt at end of stream.
    virtual smtpchan::asio::awaitable<result<std::optional<std::string>>> next() = 0;
};

class memory_source : public byte_source
{
public:
    explicit memory_source(std::string bytes)
        : bytes_(std::move(bytes))
    {
    }

    smtpchan::asio::awaitable<result<std::optional<std::string>>> next() override
    {
        if (consumed_)
            co_return ok(std::optional<std::string>());
        consumed_ = true;
        co_return ok(std::optional<std::string>(std::move(bytes_)));
    }

private:
    std::string bytes_;
    bool consumed_{false};
};

class pull_source : public byte_source
{
public:
    using producer_t = std::function<std::optional<std::string>()>;

    explicit pull_source(producer_t producer)
        : producer_(std::move(producer))
    {
    }

    smtpchan::asio::awaitable<result<std::optional<std::string>>> next() override
    {
        if (!producer_)
            co_return ok(std::optional<std::string>());
        try
        {
            co_return ok(producer_());
        }
        catch (const std::exception& exc)
        {
            co_return fail<std::optional<std::string>>(errc::source_failed, "Payload source failed.", exc.what());
        }
    }

private:
    producer_t producer_;
};

class istream_source : public byte_source
{
public:
    explicit istream_source(std::istream& in, std::size_t chunk_size = 4096)
        : in_(&in),
          chunk_size_(chunk_size == 0 ? 1 : chunk_size)
    {
    }

    smtpchan::asio::awaitable<result<std::optional<std::string>>> next() override
    {
        std::string chunk(chunk_size_, '\0');
        in_->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(in_->gcount());
        if (in_->bad())
            co_return fail<std::optional<std::string>>(errc::source_failed, "Payload stream read failed.");
        if (got == 0)
            co_return ok(std::optional<std::string>());
        chunk.resize(got);
        co_return ok(std::optional<std::string>(std::move(chunk)));
    }

private:
    std::istream* in_;
    std::size_t chunk_size_;
};

using payload = std::variant<std::string, std::shared_ptr<byte_source>>;

[[nodiscard]] inline std::shared_ptr<byte_source> to_byte_source(payload data)
{
    if (auto* source = std::get_if<std::shared_ptr<byte_source>>(&data))
    {
        if (*source)
            return std::move(*source);
        return std::make_shared<memory_source>(std::string());
    }
    return std::make_shared<memory_source>(std::get<std::string>(std::move(data)));
}

} // namespace smtp
} // namespace smtpchan
