/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "util.hpp"

#include "format.hpp"

namespace util {

std::string human_readable_duration(uint64_t seconds)
{
    if (seconds < 60) {
        return fmt::format("{}s", seconds);
    }

    auto const mins = seconds / 60;
    if (mins < 60) {
        return fmt::format("{}s ({}m {}s)", seconds, mins, seconds % 60);
    }

    return fmt::format("{}s ({}h {}m {}s)", seconds, mins / 60, mins % 60,
                       seconds % 60);
}

std::string human_readable_duration(std::chrono::microseconds duration)
{
    return human_readable_duration(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count()));
}

std::string join(std::vector<std::string> const &items, char delim,
                 char quote)
{
    std::string result;
    bool first = true;
    for (auto const &item : items) {
        if (!first) {
            result += delim;
        }
        first = false;
        if (quote) {
            result += quote;
            result += item;
            result += quote;
        } else {
            result += item;
        }
    }
    return result;
}

} // namespace util
