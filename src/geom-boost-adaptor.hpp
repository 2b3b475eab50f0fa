#ifndef MPRING_GEOM_BOOST_ADAPTOR_HPP
#define MPRING_GEOM_BOOST_ADAPTOR_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "geom.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/geometries/register/ring.hpp>

BOOST_GEOMETRY_REGISTER_POINT_2D_GET_SET(geom::point_t, double, cs::cartesian,
                                         x, y, set_x, set_y)
BOOST_GEOMETRY_REGISTER_RING(geom::ring_t)

namespace boost {
namespace geometry {
namespace traits {
template <>
struct point_order<::geom::ring_t>
{
    static const order_selector value = counterclockwise;
};
} // namespace traits
} // namespace geometry
} // namespace boost

#endif // MPRING_GEOM_BOOST_ADAPTOR_HPP
