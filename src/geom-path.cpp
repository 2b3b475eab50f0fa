/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "geom-path.hpp"

#include "geom-boost-adaptor.hpp"

namespace geom {

namespace {

/**
 * A point is inside a ring if it is inside an odd number of times (even-odd
 * rule). The default (winding) strategy of Boost.Geometry is used first to
 * rule out points outside the ring and on its boundary, because the
 * crossings strategy doesn't detect the boundary.
 */
bool ring_contains_closed(ring_t const &ring, point_t point)
{
    if (!boost::geometry::within(point, ring)) {
        return false;
    }

    return boost::geometry::within(
        point, ring,
        boost::geometry::strategy::within::crossings_multiply<point_t>{});
}

/**
 * Boost.Geometry expects closed rings to repeat the first point at the end.
 * Sub-paths are closed implicitly so the point might not be there.
 */
bool ring_contains(ring_t const &ring, point_t point)
{
    if (ring.size() < 3) {
        return false;
    }

    if (ring.is_closed()) {
        return ring_contains_closed(ring, point);
    }

    ring_t closed{ring.cbegin(), ring.cend()};
    closed.push_back(ring.front());
    return ring_contains_closed(closed, point);
}

} // anonymous namespace

void path_t::add_ring(ring_t &&ring)
{
    if (!ring.empty()) {
        m_rings.push_back(std::move(ring));
    }
}

void path_t::append(path_t const &other)
{
    m_rings.insert(m_rings.end(), other.m_rings.cbegin(),
                   other.m_rings.cend());
}

std::size_t path_t::num_vertices() const noexcept
{
    std::size_t count = 0;
    for (auto const &ring : m_rings) {
        count += ring.size();
    }
    return count;
}

bool path_t::contains(point_t point) const
{
    bool inside = false;
    for (auto const &ring : m_rings) {
        if (ring_contains(ring, point)) {
            inside = !inside;
        }
    }
    return inside;
}

box_t envelope(path_t const &path)
{
    box_t box;
    for (auto const &ring : path) {
        box.extend(ring);
    }
    return box;
}

} // namespace geom
