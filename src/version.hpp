#ifndef MPRING_VERSION_HPP
#define MPRING_VERSION_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

char const *get_build_type() noexcept;
char const *get_mpring_version() noexcept;

/// Print program name, version and library versions to stdout.
void print_version(char const *program);

#endif // MPRING_VERSION_HPP
