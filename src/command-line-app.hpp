#ifndef MPRING_COMMAND_LINE_APP_HPP
#define MPRING_COMMAND_LINE_APP_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include <CLI/CLI.hpp>

#include <string>

class command_line_app_t : public CLI::App
{
public:
    explicit command_line_app_t(std::string app_description);

    bool want_help() const;

    bool want_version() const;

    void init_logging_options();

}; // class command_line_app_t

#endif // MPRING_COMMAND_LINE_APP_HPP
