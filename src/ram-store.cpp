/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "ram-store.hpp"

#include "logging.hpp"

#include <algorithm>

std::size_t ram_store_t::store_object(osmium::OSMObject const &object)
{
    auto const offset = m_object_buffer.committed();
    m_object_buffer.add_item(object);
    m_object_buffer.commit();
    return offset;
}

void ram_store_t::node(osmium::Node const &node)
{
    if (!node.visible() || !node.location().valid()) {
        return;
    }

    m_node_store.set(node.id(), node.location());
}

void ram_store_t::way(osmium::Way const &way)
{
    m_way_index.insert_or_assign(way.id(), store_object(way));
}

void ram_store_t::relation(osmium::Relation const &relation)
{
    auto const offset = store_object(relation);
    if (m_relation_index.insert_or_assign(relation.id(), offset).second) {
        m_relation_ids.push_back(relation.id());
    }
}

osmium::Way const *ram_store_t::way_get(osmid_t id) const
{
    auto const it = m_way_index.find(id);
    if (it == m_way_index.end()) {
        return nullptr;
    }
    return &m_object_buffer.get<osmium::Way>(it->second);
}

osmium::Relation const *ram_store_t::relation_get(osmid_t id) const
{
    auto const it = m_relation_index.find(id);
    if (it == m_relation_index.end()) {
        return nullptr;
    }
    return &m_object_buffer.get<osmium::Relation>(it->second);
}

bool ram_store_t::way_selected(osmid_t id) const
{
    return m_selected_ways.count(id) > 0;
}

bool ram_store_t::way_drawable(osmium::Way const &way) const
{
    if (!way.visible()) {
        return false;
    }

    return std::all_of(way.nodes().cbegin(), way.nodes().cend(),
                       [this](osmium::NodeRef const &nr) {
                           return m_node_store.has(nr.ref());
                       });
}

void ram_store_t::select_way(osmid_t id, bool selected)
{
    if (selected) {
        m_selected_ways.insert(id);
    } else {
        m_selected_ways.erase(id);
    }
}

bool ram_store_t::move_node(osmid_t id, osmium::Location location)
{
    return m_node_store.move(id, location);
}

void ram_store_t::log_stats() const
{
    auto const mbyte = 1024 * 1024;

    log_debug("RAM store: Node locations: size={}", m_node_store.size());
    log_debug("RAM store: Ways: size={}", m_way_index.size());
    log_debug("RAM store: Relations: size={}", m_relation_index.size());
    log_debug("RAM store: Object data: size={} capacity={} bytes={}M",
              m_object_buffer.committed(), m_object_buffer.capacity(),
              m_object_buffer.capacity() / mbyte);
}
