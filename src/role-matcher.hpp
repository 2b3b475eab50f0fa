#ifndef MPRING_ROLE_MATCHER_HPP
#define MPRING_ROLE_MATCHER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "role-config.hpp"

#include <memory>

/**
 * Decides whether a member role denotes an outer or an inner ring based on
 * a role configuration snapshot.
 *
 * The snapshot can be replaced at any time with reload(). Readers always
 * work on one complete snapshot, the old or the new one.
 */
class role_matcher_t
{
public:
    /// Create a matcher with the default configuration.
    role_matcher_t();

    explicit role_matcher_t(std::shared_ptr<role_config_t const> config);

    /// Atomically replace the configuration snapshot.
    void reload(std::shared_ptr<role_config_t const> config);

    /// Get the current configuration snapshot.
    std::shared_ptr<role_config_t const> config() const;

    /**
     * Is this an outer role? True if the role matches one of the outer
     * exact roles or starts with one of the outer role prefixes. A null
     * role is never an outer role.
     */
    bool is_outer_role(char const *role) const;

    /**
     * Is this an inner role? True if the role matches one of the inner
     * exact roles or starts with one of the inner role prefixes. A null
     * role is never an inner role.
     */
    bool is_inner_role(char const *role) const;

private:
    std::shared_ptr<role_config_t const> m_config;

}; // class role_matcher_t

#endif // MPRING_ROLE_MATCHER_HPP
