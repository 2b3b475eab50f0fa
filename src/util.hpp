#ifndef MPRING_UTIL_HPP
#define MPRING_UTIL_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

/**
 * Simple timer with microsecond granularity. Starts running on
 * construction, stop() returns the time since then.
 */
class timer_t
{
public:
    timer_t() noexcept : m_start(clock::now()) {}

    std::chrono::microseconds stop() noexcept
    {
        m_duration = std::chrono::duration_cast<std::chrono::microseconds>(
            clock::now() - m_start);
        return m_duration;
    }

    std::chrono::microseconds elapsed() const noexcept { return m_duration; }

private:
    using clock = std::chrono::steady_clock;
    std::chrono::time_point<clock> m_start;
    std::chrono::microseconds m_duration{};

}; // class timer_t

/// Format a duration like "75s (1m 15s)".
std::string human_readable_duration(uint64_t seconds);

std::string human_readable_duration(std::chrono::microseconds duration);

/**
 * Join all strings with the delimiter. Every item is put between quote
 * characters unless quote is '\0'.
 */
std::string join(std::vector<std::string> const &items, char delim = ',',
                 char quote = '\0');

} // namespace util

#endif // MPRING_UTIL_HPP
