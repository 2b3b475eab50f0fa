#ifndef MPRING_NODE_STORE_HPP
#define MPRING_NODE_STORE_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "osmtypes.hpp"

#include <osmium/osm/location.hpp>

#include <cstddef>
#include <unordered_map>

/**
 * Node locations storage. This is the single owner of all node coordinates,
 * everything else refers to nodes by id and looks up the location here.
 * Unlike a pure import cache the locations can be changed after they have
 * been stored, this is how node moves are handled.
 */
class node_store_t
{
public:
    /**
     * Store a node location. If the id is already stored, the location is
     * replaced.
     */
    void set(osmid_t id, osmium::Location location);

    /**
     * Retrieve a node location. If the location wasn't stored before, an
     * invalid Location will be returned.
     */
    osmium::Location get(osmid_t id) const;

    /**
     * Change the location of an existing node.
     *
     * \return True if the node was known, false otherwise (nothing is
     *         stored in that case).
     */
    bool move(osmid_t id, osmium::Location location);

    /// Is a valid location stored for this id?
    bool has(osmid_t id) const { return get(id).valid(); }

    /// The number of locations stored.
    std::size_t size() const noexcept { return m_locations.size(); }

    /**
     * Clear the memory used by this object. The object can be reused after
     * that.
     */
    void clear();

private:
    std::unordered_map<osmid_t, osmium::Location> m_locations;

}; // class node_store_t

#endif // MPRING_NODE_STORE_HPP
