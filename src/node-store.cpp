/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "node-store.hpp"

void node_store_t::set(osmid_t id, osmium::Location location)
{
    m_locations.insert_or_assign(id, location);
}

osmium::Location node_store_t::get(osmid_t id) const
{
    auto const it = m_locations.find(id);
    if (it == m_locations.end()) {
        return osmium::Location{};
    }
    return it->second;
}

bool node_store_t::move(osmid_t id, osmium::Location location)
{
    auto const it = m_locations.find(id);
    if (it == m_locations.end()) {
        return false;
    }
    it->second = location;
    return true;
}

void node_store_t::clear()
{
    m_locations.clear();
    m_locations.rehash(0);
}
