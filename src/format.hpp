#ifndef MPRING_FORMAT_HPP
#define MPRING_FORMAT_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#define FMT_HEADER_ONLY
#include <fmt/format.h>

#include <stdexcept>
#include <utility>

/**
 * Create a std::runtime_error with a message formatted by fmt. Use as
 * \code throw fmt_error("...{}...", arg); \endcode
 */
template <typename S, typename... TArgs>
std::runtime_error fmt_error(S const &format_str, TArgs &&...args)
{
    return std::runtime_error{
        fmt::format(format_str, std::forward<TArgs>(args)...)};
}

#endif // MPRING_FORMAT_HPP
