/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "common-store.hpp"

#include "polygon-ring.hpp"

#include <memory>

namespace {

polygon_ring_t ring_from_way(test_store_t const &store, osmid_t way_id)
{
    auto const *way = store.way_get(way_id);
    REQUIRE(way);
    return polygon_ring_t{idlist_t{way->nodes()},
                          store.way_selected(way_id), way_list_t{way},
                          &store.node_store()};
}

geom::path_t square_path(double min, double max)
{
    geom::path_t path;
    path.add_ring(geom::ring_t{{min, min}, {max, min}, {max, max}, {min, max}});
    return path;
}

} // anonymous namespace

TEST_CASE("ring from closed way", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);

    auto const ring = ring_from_way(store, 10);

    REQUIRE(ring.nodes() == idlist_t{1, 2, 3, 4, 1});
    REQUIRE(ring.ways() == store.ways({10}));
    REQUIRE(ring.inners().empty());
    REQUIRE(ring.is_closed());
    REQUIRE_FALSE(ring.selected());

    REQUIRE(ring.path().num_rings() == 1);
    REQUIRE(ring.path().num_vertices() == 5);
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});
}

TEST_CASE("ring from joined way", "[NoDB]")
{
    test_store_t store;
    store.add("n1 x0 y0\n"
              "n2 x4 y0\n"
              "n3 x4 y3\n"
              "w1 Nn1,n2\n"
              "w2 Nn2,n3\n");
    store.select_way(2);

    joined_way_t joined;
    joined.nodes = idlist_t{1, 2, 3};
    joined.ways = store.ways({1, 2});
    joined.selected = true;

    polygon_ring_t const ring{joined, &store.node_store()};

    REQUIRE(ring.nodes() == idlist_t{1, 2, 3});
    REQUIRE(ring.ways() == store.ways({1, 2}));
    REQUIRE(ring.selected());
    REQUIRE_FALSE(ring.is_closed());
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 4.0, 3.0});
}

TEST_CASE("nodes without location are skipped in path", "[NoDB]")
{
    test_store_t store;
    store.add("n1 x0 y0\n"
              "n2 x4 y0\n"
              "n3 x4 y3\n");

    polygon_ring_t const ring{idlist_t{1, 2, 99, 3, 1}, false, {},
                              &store.node_store()};

    REQUIRE(ring.nodes().size() == 5);
    REQUIRE(ring.path().num_vertices() == 4);
}

TEST_CASE("uses_node checks node ids", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);

    auto const ring = ring_from_way(store, 10);

    REQUIRE(ring.uses_node(1));
    REQUIRE(ring.uses_node(4));
    REQUIRE_FALSE(ring.uses_node(5));
}

TEST_CASE("relation of path to ring", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);

    auto const ring = ring_from_way(store, 10);

    REQUIRE(ring.contains(square_path(2.0, 4.0)) == ring_relation::inside);
    REQUIRE(ring.contains(square_path(20.0, 30.0)) == ring_relation::outside);
    REQUIRE(ring.contains(square_path(5.0, 15.0)) == ring_relation::crossing);
}

TEST_CASE("empty candidate path counts as inside", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);

    auto const ring = ring_from_way(store, 10);

    REQUIRE(ring.contains(geom::path_t{}) == ring_relation::inside);
}

TEST_CASE("inner rings are holes", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add_square(11, 5, 2.0, 2.0, 6.0, 6.0);

    auto ring = ring_from_way(store, 10);
    REQUIRE(ring.path().num_rings() == 1);

    auto inner = std::make_shared<polygon_ring_t>(ring_from_way(store, 11));
    ring.add_inner(inner);

    REQUIRE(ring.inners().size() == 1);
    REQUIRE(ring.inners()[0] == inner);
    REQUIRE(ring.path().num_rings() == 2);
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});

    // a path in the hole is not inside the ring
    REQUIRE(ring.contains(square_path(3.0, 4.0)) == ring_relation::outside);
    REQUIRE(ring.contains(square_path(7.0, 8.0)) == ring_relation::inside);
}

TEST_CASE("cloned ring shares inner rings and node list", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add_square(11, 5, 2.0, 2.0, 3.0, 3.0);
    store.add_square(12, 9, 6.0, 6.0, 7.0, 7.0);

    auto original = ring_from_way(store, 10);
    auto const inner1 = std::make_shared<polygon_ring_t>(ring_from_way(store, 11));
    original.add_inner(inner1);
    REQUIRE(original.path().num_rings() == 2);

    auto copy = original.clone();

    REQUIRE(&copy.nodes() == &original.nodes());
    REQUIRE(&copy.ways() == &original.ways());
    REQUIRE(copy.inners().size() == 1);
    REQUIRE(copy.inners()[0] == inner1);
    REQUIRE(copy.path().num_rings() == 2);

    copy.add_inner(std::make_shared<polygon_ring_t>(ring_from_way(store, 12)));

    REQUIRE(copy.inners().size() == 2);
    REQUIRE(copy.path().num_rings() == 3);
    REQUIRE(original.inners().size() == 1);
    REQUIRE(original.path().num_rings() == 2);

    copy.set_selected(true);
    REQUIRE_FALSE(original.selected());
}

TEST_CASE("geometry is cached until node move is reported", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);

    auto ring = ring_from_way(store, 10);
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});

    REQUIRE(store.move_node(3, osmium::Location{20.0, 20.0}));
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});

    REQUIRE(ring.node_moved(3));
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 20.0, 20.0});
    REQUIRE(ring.path().num_vertices() == 5);
}

TEST_CASE("moving unrelated node doesn't invalidate ring", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add("n100 x50 y50\n");

    auto ring = ring_from_way(store, 10);
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});

    REQUIRE(store.move_node(100, osmium::Location{60.0, 60.0}));
    REQUIRE_FALSE(ring.node_moved(100));
    REQUIRE(ring.bounds() == geom::box_t{0.0, 0.0, 10.0, 10.0});
}

TEST_CASE("moving node of inner ring invalidates outer ring", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add_square(11, 5, 2.0, 2.0, 4.0, 4.0);

    auto ring = ring_from_way(store, 10);
    auto const inner = std::make_shared<polygon_ring_t>(ring_from_way(store, 11));
    ring.add_inner(inner);

    REQUIRE(ring.contains(square_path(4.5, 5.0)) == ring_relation::inside);

    // node 7 is the top right corner of the inner ring
    REQUIRE(store.move_node(7, osmium::Location{6.0, 6.0}));
    REQUIRE(ring.node_moved(7));

    REQUIRE(inner->bounds() == geom::box_t{2.0, 2.0, 6.0, 6.0});
    REQUIRE(ring.contains(square_path(4.5, 5.0)) == ring_relation::outside);
}
