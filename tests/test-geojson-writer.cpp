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

#include "geojson-writer.hpp"

#include <cstdio>
#include <string>

namespace {

std::string read_all(std::FILE *file)
{
    std::rewind(file);
    std::string result;
    int c = 0;
    while ((c = std::fgetc(file)) != EOF) {
        result += static_cast<char>(c);
    }
    return result;
}

} // anonymous namespace

TEST_CASE("feature from ring with inner ring", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add_square(11, 5, 2.0, 2.0, 4.0, 4.0);
    store.add("r7 Ttype=multipolygon Mw10@outer,w11@inner\n");
    store.select_way(10);

    role_matcher_t const roles;
    multipolygon_t const mp{*store.relation_get(7), store, roles};
    REQUIRE(mp.combined_rings().size() == 1);

    auto const feature = ring_to_feature(mp.combined_rings()[0], 7);

    REQUIRE(feature["type"] == "Feature");
    REQUIRE(feature["geometry"]["type"] == "Polygon");

    auto const &coordinates = feature["geometry"]["coordinates"];
    REQUIRE(coordinates.size() == 2);
    REQUIRE(coordinates[0].size() == 5);
    REQUIRE(coordinates[0][0] == coordinates[0][4]);
    REQUIRE(coordinates[0][2][0].get<double>() == Approx(10.0));
    REQUIRE(coordinates[1].size() == 5);
    REQUIRE(coordinates[1][0][1].get<double>() == Approx(2.0));

    auto const &properties = feature["properties"];
    REQUIRE(properties["relation"] == 7);
    REQUIRE(properties["ways"] == nlohmann::json::array({10}));
    REQUIRE(properties["inners"] == 1);
    REQUIRE(properties["closed"] == true);
    REQUIRE(properties["selected"] == true);
}

TEST_CASE("coordinates of open ring are closed in feature", "[NoDB]")
{
    test_store_t store;
    store.add("n1 x0 y0\n"
              "n2 x10 y0\n"
              "n3 x10 y10\n"
              "w10 Nn1,n2,n3\n"
              "r7 Ttype=multipolygon Mw10@outer\n");

    role_matcher_t const roles;
    multipolygon_t const mp{*store.relation_get(7), store, roles};

    auto const feature = ring_to_feature(mp.combined_rings()[0], 7);

    auto const &ring = feature["geometry"]["coordinates"][0];
    REQUIRE(ring.size() == 4);
    REQUIRE(ring[0] == ring[3]);
    REQUIRE(feature["properties"]["closed"] == false);
    REQUIRE(feature["properties"]["selected"] == false);
}

TEST_CASE("ring with too few positions has no feature", "[NoDB]")
{
    test_store_t store;
    store.add("n1 x0 y0\n"
              "n2 x10 y0\n"
              "w10 Nn1,n2\n"
              "r7 Ttype=multipolygon Mw10@outer\n");

    role_matcher_t const roles;
    multipolygon_t const mp{*store.relation_get(7), store, roles};
    REQUIRE(mp.combined_rings().size() == 1);

    REQUIRE(ring_to_feature(mp.combined_rings()[0], 7).is_null());

    std::FILE *file = std::tmpfile();
    REQUIRE(file);

    geojson_writer_t writer{file};
    writer.add(mp);
    writer.finish();

    REQUIRE(writer.num_features() == 0);

    auto const json = nlohmann::json::parse(read_all(file));
    std::fclose(file);

    REQUIRE(json["features"].empty());
}

TEST_CASE("write feature collection", "[NoDB]")
{
    test_store_t store;
    store.add_square(10, 1, 0.0, 0.0, 10.0, 10.0);
    store.add_square(11, 5, 20.0, 0.0, 30.0, 10.0);
    store.add_square(12, 9, 40.0, 0.0, 50.0, 10.0);
    store.add("r1 Ttype=multipolygon Mw10@outer,w11@outer\n"
              "r2 Ttype=multipolygon Mw12@outer\n");

    role_matcher_t const roles;

    std::FILE *file = std::tmpfile();
    REQUIRE(file);

    geojson_writer_t writer{file};
    writer.add(multipolygon_t{*store.relation_get(1), store, roles});
    writer.add(multipolygon_t{*store.relation_get(2), store, roles});
    writer.finish();

    REQUIRE(writer.num_features() == 3);

    auto const json = nlohmann::json::parse(read_all(file));
    std::fclose(file);

    REQUIRE(json["type"] == "FeatureCollection");
    REQUIRE(json["features"].size() == 3);
    REQUIRE(json["features"][0]["properties"]["relation"] == 1);
    REQUIRE(json["features"][1]["properties"]["relation"] == 1);
    REQUIRE(json["features"][2]["properties"]["relation"] == 2);
}

TEST_CASE("write empty feature collection", "[NoDB]")
{
    std::FILE *file = std::tmpfile();
    REQUIRE(file);

    geojson_writer_t writer{file};
    writer.finish();

    auto const json = nlohmann::json::parse(read_all(file));
    std::fclose(file);

    REQUIRE(json["type"] == "FeatureCollection");
    REQUIRE(json["features"].empty());
}
