#ifndef MPRING_GEOM_HPP
#define MPRING_GEOM_HPP

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
 * Basic geometry types. Coordinates are planar, no projection is done
 * anywhere in this code.
 */

#include <osmium/osm/location.hpp>

#include <initializer_list>
#include <vector>

namespace geom {

class point_t
{
public:
    point_t() = default;

    explicit point_t(osmium::Location location) noexcept
    : m_x(location.lon_without_check()), m_y(location.lat_without_check())
    {}

    constexpr point_t(double x, double y) noexcept : m_x(x), m_y(y) {}

    [[nodiscard]] constexpr double x() const noexcept { return m_x; }
    [[nodiscard]] constexpr double y() const noexcept { return m_y; }

    constexpr void set_x(double value) noexcept { m_x = value; }
    constexpr void set_y(double value) noexcept { m_y = value; }

    [[nodiscard]] constexpr friend bool operator==(point_t a,
                                                   point_t b) noexcept
    {
        return a.x() == b.x() && a.y() == b.y();
    }

    [[nodiscard]] constexpr friend bool operator!=(point_t a,
                                                   point_t b) noexcept
    {
        return !(a == b);
    }

private:
    double m_x = 0.0;
    double m_y = 0.0;

}; // class point_t

/// This type is used as the basis for rings.
class point_list_t : public std::vector<point_t>
{
public:
    point_list_t() = default;

    template <typename Iterator>
    point_list_t(Iterator begin, Iterator end)
    : std::vector<point_t>(begin, end)
    {}

    point_list_t(std::initializer_list<point_t> list)
    : std::vector<point_t>(list.begin(), list.end())
    {}

}; // class point_list_t

/**
 * A ring is a closed point list. The last point may or may not repeat the
 * first one, functions working on rings treat both the same.
 */
class ring_t : public point_list_t
{
public:
    using point_list_t::point_list_t;

    /// Is the ring explicitly closed, ie. are first and last point equal?
    [[nodiscard]] bool is_closed() const noexcept
    {
        return !empty() && front() == back();
    }

}; // class ring_t

} // namespace geom

#endif // MPRING_GEOM_HPP
