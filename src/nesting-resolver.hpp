#ifndef MPRING_NESTING_RESOLVER_HPP
#define MPRING_NESTING_RESOLVER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

/**
 * \file
 *
 * Code for finding out which outer ring an inner ring belongs to and for
 * combining outer rings with their inner rings.
 */

#include "polygon-ring.hpp"

#include <memory>
#include <vector>

/**
 * Find the outer ring the inner ring belongs to.
 *
 * If the bounding box of exactly one outer ring contains the bounding box
 * of the inner ring, that outer ring is returned. Otherwise, if the
 * bounding box of exactly one outer ring intersects the bounding box of
 * the inner ring, that one is returned. Otherwise the geometries are
 * checked and the innermost outer ring that is not completely outside of
 * the inner ring is returned.
 *
 * \returns Pointer to the outer ring or nullptr if none was found.
 */
polygon_ring_t *find_outer_ring(polygon_ring_t const &inner,
                                std::vector<polygon_ring_t> *outers);

/**
 * Build the combined rings, ie. the outer rings with their inner rings.
 *
 * Without inner rings, the outer rings are returned unchanged. With a
 * single outer ring all inner rings are added to a copy of it. Otherwise
 * every inner ring is added to a copy of the outer ring found by
 * find_outer_ring(). If none was found, it is added to the first outer
 * ring. This is a known approximation for broken data that is kept for
 * compatibility.
 *
 * \pre \code !outers.empty() \endcode
 */
std::vector<polygon_ring_t>
combine_rings(std::vector<polygon_ring_t> &&outers,
              std::vector<std::shared_ptr<polygon_ring_t>> const &inners);

#endif // MPRING_NESTING_RESOLVER_HPP
