/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "command-line-app.hpp"

#include "logging.hpp"

#include <cstdint>
#include <utility>

command_line_app_t::command_line_app_t(std::string app_description)
: CLI::App(std::move(app_description))
{
    option_defaults()->group("OPTIONS");

    set_help_flag();

    add_flag("-h,--help", "Print this help message and exit.");
    add_flag("-V,--version", "Show version and exit.");
}

bool command_line_app_t::want_help() const { return count("--help"); }

bool command_line_app_t::want_version() const { return count("--version"); }

void command_line_app_t::init_logging_options()
{
    add_option_function<std::string>(
        "--log-level",
        [&](std::string const &arg) {
            get_logger().set_level(log_level_from_string(arg));
        })
        ->description("Set log level ('debug', 'info' (default), 'warn', "
                      "'error').")
        ->type_name("LEVEL")
        ->group("Logging options");

    add_flag_function("--no-log-color",
                      [](int64_t) { get_logger().disable_color(); })
        ->description("Never use colors in log messages.")
        ->group("Logging options");
}
