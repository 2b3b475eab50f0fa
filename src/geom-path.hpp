#ifndef MPRING_GEOM_PATH_HPP
#define MPRING_GEOM_PATH_HPP

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
 * A path made of any number of closed sub-paths (rings) which is filled
 * using the even-odd rule: A point is inside the path if it is inside an
 * odd number of its rings. Appending a ring lying inside another ring of
 * the path turns it into a hole.
 */

#include "geom-box.hpp"
#include "geom.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace geom {

class path_t
{
public:
    using const_iterator = std::vector<ring_t>::const_iterator;

    path_t() = default;

    /// Add a closed sub-path. Empty rings are ignored.
    void add_ring(ring_t &&ring);

    /// Append all sub-paths of the other path to this one.
    void append(path_t const &other);

    void clear() noexcept { m_rings.clear(); }

    [[nodiscard]] bool empty() const noexcept { return m_rings.empty(); }

    [[nodiscard]] std::size_t num_rings() const noexcept
    {
        return m_rings.size();
    }

    /// The number of vertices over all sub-paths.
    [[nodiscard]] std::size_t num_vertices() const noexcept;

    [[nodiscard]] std::vector<ring_t> const &rings() const noexcept
    {
        return m_rings;
    }

    const_iterator begin() const noexcept { return m_rings.cbegin(); }
    const_iterator end() const noexcept { return m_rings.cend(); }

    /**
     * Is the point inside the area described by this path (even-odd rule)?
     * Points on the boundary of a ring count as outside of that ring.
     */
    [[nodiscard]] bool contains(point_t point) const;

    /**
     * Call func for every vertex of every sub-path in order.
     */
    template <typename FUNC>
    void for_each_vertex(FUNC &&func) const
    {
        for (auto const &ring : m_rings) {
            for (auto const &point : ring) {
                std::forward<FUNC>(func)(point);
            }
        }
    }

private:
    std::vector<ring_t> m_rings;

}; // class path_t

/**
 * Calculate the envelope of a path. The result is not valid if the path
 * has no vertices.
 */
box_t envelope(path_t const &path);

} // namespace geom

#endif // MPRING_GEOM_PATH_HPP
