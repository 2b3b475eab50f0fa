/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "geojson-writer.hpp"

#include "format.hpp"
#include "logging.hpp"

#include <cassert>
#include <utility>

namespace {

nlohmann::json ring_coordinates(geom::ring_t const &ring)
{
    auto coordinates = nlohmann::json::array();
    for (auto const &point : ring) {
        coordinates.push_back({point.x(), point.y()});
    }
    if (!ring.is_closed()) {
        coordinates.push_back({ring.front().x(), ring.front().y()});
    }
    return coordinates;
}

} // anonymous namespace

nlohmann::json ring_to_feature(polygon_ring_t const &ring,
                               osmid_t relation_id)
{
    auto const &path = ring.path();

    // The path must start with the ring itself followed by one sub-path
    // for each inner ring. Otherwise some node locations were missing.
    if (path.num_rings() != ring.inners().size() + 1) {
        return nullptr;
    }

    // A linear ring in GeoJSON needs at least four positions.
    auto coordinates = nlohmann::json::array();
    for (auto const &r : path) {
        auto rc = ring_coordinates(r);
        if (rc.size() < 4) {
            return nullptr;
        }
        coordinates.push_back(std::move(rc));
    }

    auto ways = nlohmann::json::array();
    for (auto const *way : ring.ways()) {
        ways.push_back(way->id());
    }

    return {{"type", "Feature"},
            {"geometry", {{"type", "Polygon"}, {"coordinates", coordinates}}},
            {"properties",
             {{"relation", relation_id},
              {"ways", ways},
              {"inners", ring.inners().size()},
              {"closed", ring.is_closed()},
              {"selected", ring.selected()}}}};
}

geojson_writer_t::geojson_writer_t(std::FILE *out) : m_out(out)
{
    assert(m_out);
    fmt::print(m_out, "{}\n", R"({"type": "FeatureCollection", "features": [)");
}

void geojson_writer_t::add(multipolygon_t const &multipolygon)
{
    for (auto const &ring : multipolygon.combined_rings()) {
        auto const feature = ring_to_feature(ring, multipolygon.relation_id());
        if (feature.is_null()) {
            log_warn("Relation {}: ring without usable geometry skipped.",
                     multipolygon.relation_id());
            continue;
        }
        fmt::print(m_out, "{}{}\n", (m_count == 0 ? "" : ","),
                   feature.dump());
        ++m_count;
    }
}

void geojson_writer_t::finish()
{
    assert(!m_finished);
    fmt::print(m_out, "]}}\n");
    m_finished = true;
}
