/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "role-matcher.hpp"

#include <algorithm>
#include <cassert>
#include <string_view>
#include <utility>

namespace {

bool matches(std::string_view role, std::vector<std::string> const &exact,
             std::vector<std::string> const &prefixes)
{
    if (std::any_of(exact.cbegin(), exact.cend(),
                    [&](std::string const &r) { return role == r; })) {
        return true;
    }

    return std::any_of(prefixes.cbegin(), prefixes.cend(),
                       [&](std::string const &prefix) {
                           return role.substr(0, prefix.size()) == prefix;
                       });
}

} // anonymous namespace

role_matcher_t::role_matcher_t()
: m_config(std::make_shared<role_config_t const>())
{
}

role_matcher_t::role_matcher_t(std::shared_ptr<role_config_t const> config)
: m_config(std::move(config))
{
    assert(m_config);
}

void role_matcher_t::reload(std::shared_ptr<role_config_t const> config)
{
    assert(config);
    std::atomic_store(&m_config, std::move(config));
}

std::shared_ptr<role_config_t const> role_matcher_t::config() const
{
    return std::atomic_load(&m_config);
}

bool role_matcher_t::is_outer_role(char const *role) const
{
    if (!role) {
        return false;
    }

    auto const snapshot = config();
    return matches(role, snapshot->outer_exact_roles(),
                   snapshot->outer_role_prefixes());
}

bool role_matcher_t::is_inner_role(char const *role) const
{
    if (!role) {
        return false;
    }

    auto const snapshot = config();
    return matches(role, snapshot->inner_exact_roles(),
                   snapshot->inner_role_prefixes());
}
