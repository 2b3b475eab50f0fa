/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "polygon-ring.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

polygon_ring_t::polygon_ring_t(idlist_t nodes, bool selected, way_list_t ways,
                               node_store_t const *node_store)
: m_nodes(std::make_shared<idlist_t const>(std::move(nodes))),
  m_ways(std::make_shared<way_list_t const>(std::move(ways))),
  m_node_store(node_store), m_selected(selected)
{
    assert(m_node_store);
}

polygon_ring_t::polygon_ring_t(joined_way_t const &joined_way,
                               node_store_t const *node_store)
: polygon_ring_t(joined_way.nodes, joined_way.selected, joined_way.ways,
                 node_store)
{
}

polygon_ring_t polygon_ring_t::clone() const { return polygon_ring_t{*this}; }

bool polygon_ring_t::is_closed() const noexcept
{
    return m_nodes->empty() || m_nodes->front() == m_nodes->back();
}

bool polygon_ring_t::uses_node(osmid_t id) const noexcept
{
    return std::find(m_nodes->cbegin(), m_nodes->cend(), id) !=
           m_nodes->cend();
}

void polygon_ring_t::build_path() const
{
    m_path.clear();

    geom::ring_t ring;
    ring.reserve(m_nodes->size());
    for (auto const id : *m_nodes) {
        auto const location = m_node_store->get(id);
        if (location.valid()) {
            ring.emplace_back(location);
        }
    }
    m_path.add_ring(std::move(ring));

    for (auto const &inner : m_inners) {
        m_path.append(inner->path());
    }

    m_path_valid = true;
}

geom::path_t const &polygon_ring_t::path() const
{
    if (!m_path_valid) {
        build_path();
    }
    return m_path;
}

geom::box_t const &polygon_ring_t::bounds() const
{
    if (!m_bounds_valid) {
        m_bounds = geom::envelope(path());
        m_bounds_valid = true;
    }
    return m_bounds;
}

void polygon_ring_t::add_inner(std::shared_ptr<polygon_ring_t> inner)
{
    assert(inner);
    assert(inner->inners().empty());

    if (m_path_valid) {
        m_path.append(inner->path());
    }
    m_bounds_valid = false;

    m_inners.push_back(std::move(inner));
}

ring_relation polygon_ring_t::contains(geom::path_t const &candidate) const
{
    auto const &own_path = path();

    std::size_t inside = 0;
    std::size_t total = 0;
    candidate.for_each_vertex([&](geom::point_t point) {
        if (own_path.contains(point)) {
            ++inside;
        }
        ++total;
    });

    if (inside == total) {
        return ring_relation::inside;
    }
    if (inside == 0) {
        return ring_relation::outside;
    }
    return ring_relation::crossing;
}

void polygon_ring_t::invalidate() noexcept
{
    m_path_valid = false;
    m_bounds_valid = false;
}

bool polygon_ring_t::node_moved(osmid_t id)
{
    bool inner_changed = false;
    for (auto const &inner : m_inners) {
        if (inner->uses_node(id)) {
            inner->invalidate();
            inner_changed = true;
        }
    }

    if (inner_changed || uses_node(id)) {
        invalidate();
        return true;
    }

    return false;
}
