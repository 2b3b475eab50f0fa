#ifndef MPRING_DATA_STORE_HPP
#define MPRING_DATA_STORE_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "node-store.hpp"
#include "osmtypes.hpp"

#include <osmium/osm/relation.hpp>
#include <osmium/osm/way.hpp>

/**
 * Interface for getting the OSM objects the multipolygon code works on. The
 * store owns all objects, callers only get non-owning pointers which stay
 * valid until the store is modified (moving nodes does not count as
 * modification).
 */
struct data_store_t
{
    virtual ~data_store_t() = 0;

    /**
     * Retrieve a way.
     *
     * \return Pointer to the way or nullptr if it is not available.
     */
    virtual osmium::Way const *way_get(osmid_t id) const = 0;

    /**
     * Retrieve a relation.
     *
     * \return Pointer to the relation or nullptr if it is not available.
     */
    virtual osmium::Relation const *relation_get(osmid_t id) const = 0;

    /// Is the way with this id currently selected by the user?
    virtual bool way_selected(osmid_t id) const = 0;

    /**
     * Can this way be drawn? Ways that are deleted or that reference nodes
     * whose location is unknown can not be drawn.
     */
    virtual bool way_drawable(osmium::Way const &way) const = 0;

    /// Access to the node locations.
    virtual node_store_t const &node_store() const noexcept = 0;
};

inline data_store_t::~data_store_t() = default;

#endif // MPRING_DATA_STORE_HPP
