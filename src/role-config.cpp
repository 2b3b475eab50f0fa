/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "role-config.hpp"

#include "format.hpp"
#include "logging.hpp"

#include <algorithm>
#include <fstream>

namespace {

bool is_space(char c) noexcept
{
    return static_cast<unsigned char>(c) <= ' ';
}

std::string trim(std::string const &str)
{
    auto const begin = std::find_if_not(str.cbegin(), str.cend(), is_space);
    if (begin == str.cend()) {
        return std::string{};
    }
    auto const last = std::find_if_not(str.crbegin(), str.crend(), is_space);
    return std::string{begin, last.base()};
}

std::vector<std::string> get_list(nlohmann::json const &json, char const *key)
{
    std::vector<std::string> list;

    auto const it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return list;
    }

    if (!it->is_array()) {
        throw fmt_error("Role setting '{}' must be an array of strings.", key);
    }

    for (auto const &entry : *it) {
        if (entry.is_null()) {
            continue;
        }
        if (!entry.is_string()) {
            throw fmt_error("Entries in role setting '{}' must be strings,"
                            " found {}.",
                            key, entry.dump());
        }
        list.push_back(entry.get<std::string>());
    }

    return list;
}

void set_if_not_empty(std::vector<std::string> *target,
                      std::vector<std::string> const &list)
{
    auto normalized = normalize_roles(list);
    if (!normalized.empty()) {
        *target = std::move(normalized);
    }
}

} // anonymous namespace

void role_settings_t::override_with(role_settings_t const &other)
{
    if (!other.outer_exact_roles.empty()) {
        outer_exact_roles = other.outer_exact_roles;
    }
    if (!other.outer_role_prefixes.empty()) {
        outer_role_prefixes = other.outer_role_prefixes;
    }
    if (!other.inner_exact_roles.empty()) {
        inner_exact_roles = other.inner_exact_roles;
    }
    if (!other.inner_role_prefixes.empty()) {
        inner_role_prefixes = other.inner_role_prefixes;
    }
}

role_settings_t role_settings_from_json(nlohmann::json const &json)
{
    if (!json.is_object()) {
        throw std::runtime_error{"Role configuration must be a JSON object."};
    }

    for (auto const &item : json.items()) {
        auto const &key = item.key();
        if (key != outer_exact_roles_key && key != outer_role_prefixes_key &&
            key != inner_exact_roles_key && key != inner_role_prefixes_key) {
            log_warn("Ignoring unknown role setting '{}'.", key);
        }
    }

    role_settings_t settings;
    settings.outer_exact_roles = get_list(json, outer_exact_roles_key);
    settings.outer_role_prefixes = get_list(json, outer_role_prefixes_key);
    settings.inner_exact_roles = get_list(json, inner_exact_roles_key);
    settings.inner_role_prefixes = get_list(json, inner_role_prefixes_key);
    return settings;
}

role_settings_t read_role_settings(std::string const &filename)
{
    std::ifstream file{filename};
    if (!file) {
        throw fmt_error("Could not open role config file '{}'.", filename);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (nlohmann::json::parse_error const &e) {
        throw fmt_error("Error parsing role config file '{}': {}", filename,
                        e.what());
    }

    log_debug("Read role config file '{}'.", filename);

    return role_settings_from_json(json);
}

std::vector<std::string> normalize_roles(std::vector<std::string> const &list)
{
    std::vector<std::string> result;
    result.reserve(list.size());

    for (auto const &entry : list) {
        auto role = trim(entry);
        if (std::find(result.cbegin(), result.cend(), role) == result.cend()) {
            result.push_back(std::move(role));
        }
    }

    return result;
}

role_config_t::role_config_t() = default;

role_config_t::role_config_t(role_settings_t const &settings)
{
    set_if_not_empty(&m_outer_exact_roles, settings.outer_exact_roles);
    set_if_not_empty(&m_outer_role_prefixes, settings.outer_role_prefixes);
    set_if_not_empty(&m_inner_exact_roles, settings.inner_exact_roles);
    set_if_not_empty(&m_inner_role_prefixes, settings.inner_role_prefixes);
}
