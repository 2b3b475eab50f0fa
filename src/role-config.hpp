#ifndef MPRING_ROLE_CONFIG_HPP
#define MPRING_ROLE_CONFIG_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

/**
 * \file
 *
 * Configuration deciding which member roles denote outer or inner rings of
 * a multipolygon. Settings can come from a JSON file and from the command
 * line, they are turned into an immutable role_config_t.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

/// Names of the recognized settings (in JSON config files).
constexpr char const *const outer_exact_roles_key = "outer-exact-roles";
constexpr char const *const outer_role_prefixes_key = "outer-role-prefixes";
constexpr char const *const inner_exact_roles_key = "inner-exact-roles";
constexpr char const *const inner_role_prefixes_key = "inner-role-prefixes";

/**
 * Raw role settings as read from some configuration source. An empty list
 * means "not set".
 */
struct role_settings_t
{
    std::vector<std::string> outer_exact_roles;
    std::vector<std::string> outer_role_prefixes;
    std::vector<std::string> inner_exact_roles;
    std::vector<std::string> inner_role_prefixes;

    /**
     * Replace every list in this object by the corresponding list in the
     * other object if that is not empty.
     */
    void override_with(role_settings_t const &other);
};

/**
 * Get role settings from a JSON object. Members with the names of the
 * settings must be arrays of strings, null entries in the arrays are
 * ignored. Unknown members are ignored with a warning.
 *
 * \throws std::runtime_error if the JSON has the wrong structure.
 */
role_settings_t role_settings_from_json(nlohmann::json const &json);

/**
 * Read role settings from a JSON file.
 *
 * \throws std::runtime_error if the file can not be read or parsed or has
 *         the wrong structure.
 */
role_settings_t read_role_settings(std::string const &filename);

/**
 * Trim whitespace from all entries and remove duplicates, keeping the first
 * occurrence of each entry.
 */
std::vector<std::string> normalize_roles(std::vector<std::string> const &list);

/**
 * Immutable role configuration. Outer exact roles default to "outer", inner
 * exact roles default to "inner", the prefix lists default to empty. A
 * non-empty list in the settings replaces the default completely.
 */
class role_config_t
{
public:
    role_config_t();

    explicit role_config_t(role_settings_t const &settings);

    std::vector<std::string> const &outer_exact_roles() const noexcept
    {
        return m_outer_exact_roles;
    }

    std::vector<std::string> const &outer_role_prefixes() const noexcept
    {
        return m_outer_role_prefixes;
    }

    std::vector<std::string> const &inner_exact_roles() const noexcept
    {
        return m_inner_exact_roles;
    }

    std::vector<std::string> const &inner_role_prefixes() const noexcept
    {
        return m_inner_role_prefixes;
    }

private:
    std::vector<std::string> m_outer_exact_roles{"outer"};
    std::vector<std::string> m_outer_role_prefixes;
    std::vector<std::string> m_inner_exact_roles{"inner"};
    std::vector<std::string> m_inner_role_prefixes;

}; // class role_config_t

#endif // MPRING_ROLE_CONFIG_HPP
