#ifndef MPRING_MULTIPOLYGON_HPP
#define MPRING_MULTIPOLYGON_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "data-store.hpp"
#include "osmtypes.hpp"
#include "polygon-ring.hpp"
#include "role-matcher.hpp"

#include <osmium/osm/relation.hpp>

#include <vector>

/**
 * The rings of a multipolygon relation ready for rendering.
 *
 * All work is done in the constructor: Member ways are sorted into outer
 * and inner ways based on their role, open ways are joined into rings and
 * inner rings are added to the outer ring they are in.
 *
 * Broken data is handled as well as possible, nothing here throws because
 * of bad data:
 * - Members that are not ways, that can not be drawn, or that have fewer
 *   than two nodes are ignored.
 * - Members with a role that is neither an outer nor an inner role are
 *   ignored. Members without role are treated as outer members.
 * - Ways that can't be joined into closed rings end up in open rings.
 */
class multipolygon_t
{
public:
    multipolygon_t(osmium::Relation const &relation, data_store_t const &store,
                   role_matcher_t const &role_matcher);

    osmid_t relation_id() const noexcept { return m_relation_id; }

    /// The member ways with an outer role (or no role) in member order.
    way_list_t const &outer_ways() const noexcept { return m_outer_ways; }

    /// The member ways with an inner role in member order.
    way_list_t const &inner_ways() const noexcept { return m_inner_ways; }

    /// The outer rings, each with its inner rings.
    std::vector<polygon_ring_t> const &combined_rings() const noexcept
    {
        return m_combined_rings;
    }

    /**
     * Must be called after the location of a node changed in the store.
     * Rings using the node are invalidated and will be rebuilt when their
     * geometry is accessed next time.
     *
     * \return True if any ring of this multipolygon uses the node.
     */
    bool node_moved(osmid_t id);

private:
    void load(osmium::Relation const &relation,
              role_matcher_t const &role_matcher);

    std::vector<polygon_ring_t> create_rings(way_list_t const &ways) const;

    data_store_t const *m_store;
    osmid_t m_relation_id;

    way_list_t m_outer_ways;
    way_list_t m_inner_ways;

    std::vector<polygon_ring_t> m_combined_rings;

}; // class multipolygon_t

#endif // MPRING_MULTIPOLYGON_HPP
