/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "logging.hpp"

#include <ctime>

/// Global logger singleton
logger the_logger{};

/// Access the global logger singleton
logger &get_logger() noexcept { return the_logger; }

std::string logger::generate_common_prefix(fmt::text_style const &ts,
                                           char const *prefix) const
{
    std::string str = fmt::format("{:%Y-%m-%d %H:%M:%S}  ",
                                  fmt::localtime(std::time(nullptr)));

    if (prefix) {
        str += fmt::format(ts, "{}: ", prefix);
    }

    return str;
}

log_level log_level_from_string(std::string const &name)
{
    if (name == "debug") {
        return log_level::debug;
    }
    if (name == "info") {
        return log_level::info;
    }
    if (name == "warn" || name == "warning") {
        return log_level::warn;
    }
    if (name == "error") {
        return log_level::error;
    }

    throw fmt_error("Unknown log level '{}'. Use 'debug', 'info', 'warn',"
                    " or 'error'.",
                    name);
}
