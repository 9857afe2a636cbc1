/**
 * @file timeout_config.hpp
 * @brief Default deadlines for channel operations.
 * @author smtpchan contributors
 *
 * A per-call timeout always wins; these values apply when a call leaves its
 * timeout unset. A zero duration, per call or here, means "no deadline".
 */

#ifndef SMTPCHAN_DETAIL_TIMEOUT_CONFIG_HPP
#define SMTPCHAN_DETAIL_TIMEOUT_CONFIG_HPP

#include <chrono>
#include <optional>

namespace smtpchan {

/**
 * Per-operation timeout configuration.
 *
 * Example:
 * @code
 * timeout_config timeouts;
 * timeouts.connect = std::chrono::seconds(10);
 * timeouts.command = std::chrono::seconds(30);
 *
 * smtp::channel_config cfg;
 * cfg.timeouts = timeouts;
 * @endcode
 */
struct timeout_config
{
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    /// TCP connect, optional TLS handshake and greeting
    std::optional<duration> connect;

    /// write() until the terminal reply line
    std::optional<duration> command;

    /// close() until the socket is released
    std::optional<duration> close;

    /// negotiate_tls() handshake
    std::optional<duration> upgrade;

    /**
     * Resolve the deadline for one call.
     *
     * @param per_call  Timeout given to the call, if any.
     * @param fallback  Matching member of this configuration.
     * @return Absolute deadline, or nullopt when the operation is unbounded.
     */
    static std::optional<time_point> deadline(std::optional<duration> per_call,
        std::optional<duration> fallback)
    {
        const std::optional<duration> chosen = per_call.has_value() ? per_call : fallback;
        if (!chosen.has_value() || *chosen <= duration::zero())
            return std::nullopt;
        return std::chrono::steady_clock::now() + *chosen;
    }

    /**
     * No deadlines at all (the default).
     */
    static timeout_config none()
    {
        return {};
    }

    /**
     * Same deadline for every operation.
     */
    static timeout_config uniform(duration timeout)
    {
        timeout_config cfg;
        cfg.connect = timeout;
        cfg.command = timeout;
        cfg.close = timeout;
        cfg.upgrade = timeout;
        return cfg;
    }
};

} // namespace smtpchan

#endif // SMTPCHAN_DETAIL_TIMEOUT_CONFIG_HPP
