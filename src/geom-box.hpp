#ifndef MPRING_GEOM_BOX_HPP
#define MPRING_GEOM_BOX_HPP

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
 * Class and functions for axis-aligned bounding boxes.
 */

#include "geom.hpp"

#include <cassert>
#include <limits>

namespace geom {

class box_t
{
public:
    constexpr box_t() noexcept = default;

    constexpr box_t(double min_x, double min_y, double max_x,
                    double max_y) noexcept
    : m_min_x(min_x), m_min_y(min_y), m_max_x(max_x), m_max_y(max_y)
    {
        assert(min_x <= max_x);
        assert(min_y <= max_y);
    }

    box_t &extend(point_t const &point) noexcept;
    void extend(point_list_t const &list) noexcept;
    void extend(box_t const &box) noexcept;

    constexpr double min_x() const noexcept { return m_min_x; }
    constexpr double min_y() const noexcept { return m_min_y; }
    constexpr double max_x() const noexcept { return m_max_x; }
    constexpr double max_y() const noexcept { return m_max_y; }

    constexpr double width() const noexcept { return m_max_x - m_min_x; }
    constexpr double height() const noexcept { return m_max_y - m_min_y; }

    /// A box is valid once it has been extended by at least one point.
    constexpr bool valid() const noexcept
    {
        return m_min_x <= m_max_x && m_min_y <= m_max_y;
    }

    /// A box without area (or not valid) is empty.
    constexpr bool empty() const noexcept
    {
        return !valid() || width() <= 0.0 || height() <= 0.0;
    }

    /**
     * Does this box completely contain the other box? Boundaries may
     * touch. Empty boxes never contain and are never contained.
     */
    bool contains(box_t const &other) const noexcept;

    /**
     * Do the interiors of this box and the other box overlap? Boxes only
     * touching at their boundaries do not intersect. Empty boxes never
     * intersect anything.
     */
    bool intersects(box_t const &other) const noexcept;

    constexpr friend bool operator==(box_t const &a, box_t const &b)
    {
        return a.min_x() == b.min_x() && a.min_y() == b.min_y() &&
               a.max_x() == b.max_x() && a.max_y() == b.max_y();
    }

    constexpr friend bool operator!=(box_t const &a, box_t const &b)
    {
        return !(a == b);
    }

private:
    double m_min_x = std::numeric_limits<double>::max();
    double m_min_y = std::numeric_limits<double>::max();
    double m_max_x = std::numeric_limits<double>::lowest();
    double m_max_y = std::numeric_limits<double>::lowest();

}; // class box_t

} // namespace geom

#endif // MPRING_GEOM_BOX_HPP
