/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "multipolygon.hpp"

#include "logging.hpp"
#include "nesting-resolver.hpp"
#include "way-joiner.hpp"

#include <memory>
#include <utility>

multipolygon_t::multipolygon_t(osmium::Relation const &relation,
                               data_store_t const &store,
                               role_matcher_t const &role_matcher)
: m_store(&store), m_relation_id(relation.id())
{
    load(relation, role_matcher);
}

void multipolygon_t::load(osmium::Relation const &relation,
                          role_matcher_t const &role_matcher)
{
    // Fill inner and outer list with valid ways
    for (auto const &member : relation.members()) {
        if (member.type() != osmium::item_type::way) {
            continue;
        }

        auto const *way = m_store->way_get(member.ref());
        if (!way || !m_store->way_drawable(*way)) {
            log_debug("Relation {}: way {} can not be drawn.", m_relation_id,
                      member.ref());
            continue;
        }

        if (way->nodes().size() < 2) {
            log_debug("Relation {}: way {} has fewer than two nodes.",
                      m_relation_id, member.ref());
            continue;
        }

        char const *const role = member.role();
        if (role_matcher.is_inner_role(role)) {
            m_inner_ways.push_back(way);
        } else if (role_matcher.is_outer_role(role) || role[0] == '\0') {
            m_outer_ways.push_back(way);
        } else {
            log_debug("Relation {}: ignoring way {} with role '{}'.",
                      m_relation_id, member.ref(), role);
        }
    }

    auto inner_rings = create_rings(m_inner_ways);
    auto outer_rings = create_rings(m_outer_ways);

    if (outer_rings.empty()) {
        return;
    }

    std::vector<std::shared_ptr<polygon_ring_t>> inners;
    inners.reserve(inner_rings.size());
    for (auto &ring : inner_rings) {
        inners.push_back(std::make_shared<polygon_ring_t>(std::move(ring)));
    }

    m_combined_rings = combine_rings(std::move(outer_rings), inners);

    log_debug("Relation {}: {} outer way(s), {} inner way(s), {} ring(s).",
              m_relation_id, m_outer_ways.size(), m_inner_ways.size(),
              m_combined_rings.size());
}

std::vector<polygon_ring_t>
multipolygon_t::create_rings(way_list_t const &ways) const
{
    std::vector<polygon_ring_t> rings;
    way_list_t ways_to_join;

    for (auto const *way : ways) {
        if (way->is_closed()) {
            rings.emplace_back(idlist_t{way->nodes()},
                               m_store->way_selected(way->id()),
                               way_list_t{way}, &m_store->node_store());
        } else {
            ways_to_join.push_back(way);
        }
    }

    for (auto const &joined_way : join_ways(ways_to_join, *m_store)) {
        rings.emplace_back(joined_way, &m_store->node_store());
    }

    return rings;
}

bool multipolygon_t::node_moved(osmid_t id)
{
    bool changed = false;
    for (auto &ring : m_combined_rings) {
        if (ring.node_moved(id)) {
            changed = true;
        }
    }
    return changed;
}
