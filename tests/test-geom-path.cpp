/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "geom-path.hpp"

namespace {

geom::ring_t square(double min, double max)
{
    return geom::ring_t{
        {min, min}, {max, min}, {max, max}, {min, max}, {min, min}};
}

} // anonymous namespace

TEST_CASE("Empty path contains nothing", "[NoDB]")
{
    geom::path_t const path;

    REQUIRE(path.empty());
    REQUIRE(path.num_rings() == 0);
    REQUIRE(path.num_vertices() == 0);
    REQUIRE_FALSE(path.contains(geom::point_t{0.0, 0.0}));
    REQUIRE_FALSE(geom::envelope(path).valid());
}

TEST_CASE("Empty rings are not added to path", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(geom::ring_t{});

    REQUIRE(path.empty());
}

TEST_CASE("Path with one ring", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(square(0.0, 10.0));

    REQUIRE(path.num_rings() == 1);
    REQUIRE(path.num_vertices() == 5);

    REQUIRE(path.contains(geom::point_t{5.0, 5.0}));
    REQUIRE(path.contains(geom::point_t{0.5, 9.5}));
    REQUIRE_FALSE(path.contains(geom::point_t{15.0, 5.0}));
    REQUIRE_FALSE(path.contains(geom::point_t{-1.0, -1.0}));

    REQUIRE(geom::envelope(path) == geom::box_t{0.0, 0.0, 10.0, 10.0});
}

TEST_CASE("Points on the boundary are outside", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(square(0.0, 10.0));

    REQUIRE_FALSE(path.contains(geom::point_t{0.0, 0.0}));
    REQUIRE_FALSE(path.contains(geom::point_t{10.0, 5.0}));
}

TEST_CASE("Rings don't have to repeat the first point", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(geom::ring_t{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}});

    REQUIRE(path.num_vertices() == 3);
    REQUIRE(path.contains(geom::point_t{2.0, 2.0}));
    REQUIRE_FALSE(path.contains(geom::point_t{8.0, 8.0}));
}

TEST_CASE("Degenerate rings contain nothing", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(geom::ring_t{{0.0, 0.0}, {10.0, 10.0}});

    REQUIRE(path.num_rings() == 1);
    REQUIRE_FALSE(path.contains(geom::point_t{5.0, 5.0}));
}

TEST_CASE("Even-odd rule turns inner ring into hole", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(square(0.0, 10.0));
    path.add_ring(square(2.0, 4.0));

    REQUIRE(path.num_rings() == 2);
    REQUIRE(path.num_vertices() == 10);

    REQUIRE(path.contains(geom::point_t{1.0, 1.0}));
    REQUIRE(path.contains(geom::point_t{8.0, 8.0}));
    REQUIRE_FALSE(path.contains(geom::point_t{3.0, 3.0}));

    // an island in the hole
    path.add_ring(square(2.5, 3.5));
    REQUIRE(path.contains(geom::point_t{3.0, 3.0}));
    REQUIRE_FALSE(path.contains(geom::point_t{2.2, 2.2}));

    REQUIRE(geom::envelope(path) == geom::box_t{0.0, 0.0, 10.0, 10.0});
}

TEST_CASE("Append path to path", "[NoDB]")
{
    geom::path_t a;
    a.add_ring(square(0.0, 1.0));

    geom::path_t b;
    b.add_ring(square(5.0, 6.0));
    b.add_ring(square(7.0, 8.0));

    a.append(b);

    REQUIRE(a.num_rings() == 3);
    REQUIRE(b.num_rings() == 2);
    REQUIRE(a.rings()[1] == square(5.0, 6.0));
    REQUIRE(geom::envelope(a) == geom::box_t{0.0, 0.0, 8.0, 8.0});

    a.clear();
    REQUIRE(a.empty());
}

TEST_CASE("Iterate over all vertices of a path", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(square(0.0, 1.0));
    path.add_ring(geom::ring_t{{5.0, 5.0}, {6.0, 5.0}, {6.0, 6.0}});

    std::size_t count = 0;
    double sum_x = 0.0;
    path.for_each_vertex([&](geom::point_t point) {
        ++count;
        sum_x += point.x();
    });

    REQUIRE(count == 8);
    REQUIRE(sum_x == Approx(19.0));
}

TEST_CASE("Self-intersecting ring uses even-odd rule", "[NoDB]")
{
    // pentagram: the center is surrounded twice
    geom::path_t path;
    path.add_ring(geom::ring_t{{0.0, 10.0},
                               {6.0, -8.0},
                               {-9.5, 3.0},
                               {9.5, 3.0},
                               {-6.0, -8.0},
                               {0.0, 10.0}});

    REQUIRE_FALSE(path.contains(geom::point_t{0.0, 0.0}));
    REQUIRE(path.contains(geom::point_t{0.0, 8.0}));
    REQUIRE(path.contains(geom::point_t{-7.0, 2.5}));
    REQUIRE_FALSE(path.contains(geom::point_t{0.0, 12.0}));
}

TEST_CASE("Self-intersecting ring without closing point", "[NoDB]")
{
    geom::path_t path;
    path.add_ring(geom::ring_t{
        {0.0, 10.0}, {6.0, -8.0}, {-9.5, 3.0}, {9.5, 3.0}, {-6.0, -8.0}});

    REQUIRE_FALSE(path.contains(geom::point_t{0.0, 0.0}));
    REQUIRE(path.contains(geom::point_t{0.0, 8.0}));
}
