#ifndef MPRING_POLYGON_RING_HPP
#define MPRING_POLYGON_RING_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "geom-box.hpp"
#include "geom-path.hpp"
#include "node-store.hpp"
#include "osmtypes.hpp"
#include "way-joiner.hpp"

#include <memory>
#include <vector>

/// Relationship of a candidate path to a ring, see polygon_ring_t::contains().
enum class ring_relation
{
    inside,
    outside,
    crossing
};

/**
 * A polygon ring built from one or more ways. An outer ring can carry inner
 * rings, their paths are part of the path of the outer ring so that, using
 * the even-odd rule, they become holes. Inner rings never have inner rings
 * of their own.
 *
 * The node list and the list of contributing ways never change after
 * construction. The path and the bounding box are calculated from the
 * current node locations in the node store when needed and cached. Node
 * moves and new inner rings invalidate the caches.
 */
class polygon_ring_t
{
public:
    using inner_list_t = std::vector<std::shared_ptr<polygon_ring_t>>;

    /**
     * Create ring from node ids.
     *
     * \param nodes Node ids of the ring. Ids without location in the node
     *              store are skipped when the geometry is built.
     * \param selected Is this ring selected?
     * \param ways The ways this ring was built from.
     * \param node_store Where to get the node locations from. Must outlive
     *                   this object.
     */
    polygon_ring_t(idlist_t nodes, bool selected, way_list_t ways,
                   node_store_t const *node_store);

    /// Create ring from a chain of joined ways.
    polygon_ring_t(joined_way_t const &joined_way,
                   node_store_t const *node_store);

    polygon_ring_t(polygon_ring_t &&) noexcept = default;
    polygon_ring_t &operator=(polygon_ring_t &&) noexcept = default;

    polygon_ring_t &operator=(polygon_ring_t const &) = delete;

    ~polygon_ring_t() noexcept = default;

    /**
     * Create a copy of this ring. The cached geometry is copied, the node
     * and way lists are shared (they are immutable anyway), the list of
     * inner rings is copied but refers to the same inner ring objects.
     */
    polygon_ring_t clone() const;

    idlist_t const &nodes() const noexcept { return *m_nodes; }

    way_list_t const &ways() const noexcept { return *m_ways; }

    inner_list_t const &inners() const noexcept { return m_inners; }

    bool selected() const noexcept { return m_selected; }

    void set_selected(bool selected) noexcept { m_selected = selected; }

    /// Is the node list of this ring closed (first node same as last)?
    bool is_closed() const noexcept;

    /// Is this node id part of the node list of this ring?
    bool uses_node(osmid_t id) const noexcept;

    /**
     * The geometry of this ring: the ring itself followed by the paths of
     * all inner rings.
     */
    geom::path_t const &path() const;

    /// The bounding box of the path.
    geom::box_t const &bounds() const;

    /**
     * Add an inner ring. Its path is appended to the path of this ring
     * turning it into a hole. The caller is responsible for making sure
     * the inner ring is actually inside this ring.
     */
    void add_inner(std::shared_ptr<polygon_ring_t> inner);

    /**
     * Find out how the candidate path relates to this ring by checking
     * for every vertex of the candidate whether it is inside the path of
     * this ring (including holes). If all vertices are inside, the result
     * is "inside", if none are "outside", otherwise "crossing".
     *
     * Only vertices are checked, so rings with crossing edges but no
     * vertex inside the other ring are reported as "outside".
     */
    ring_relation contains(geom::path_t const &candidate) const;

    /**
     * Called when the location of a node changed. Inner rings using the
     * node are invalidated. If this ring uses the node or an inner ring was
     * invalidated, this ring is invalidated too.
     *
     * \return True if anything was invalidated.
     */
    bool node_moved(osmid_t id);

private:
    polygon_ring_t(polygon_ring_t const &) = default;

    void invalidate() noexcept;

    void build_path() const;

    std::shared_ptr<idlist_t const> m_nodes;
    std::shared_ptr<way_list_t const> m_ways;
    inner_list_t m_inners;
    node_store_t const *m_node_store;

    mutable geom::path_t m_path;
    mutable geom::box_t m_bounds;
    mutable bool m_path_valid = false;
    mutable bool m_bounds_valid = false;

    bool m_selected;

}; // class polygon_ring_t

#endif // MPRING_POLYGON_RING_HPP
