#ifndef MPRING_GEOJSON_WRITER_HPP
#define MPRING_GEOJSON_WRITER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "multipolygon.hpp"
#include "polygon-ring.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

/**
 * Create a GeoJSON feature from a combined ring. The geometry is a Polygon
 * with the ring as outer ring and its inner rings as holes.
 *
 * \returns JSON null if the ring has no usable geometry, that is if node
 *          locations are missing or the ring or one of its inner rings
 *          has less than three distinct positions.
 */
nlohmann::json ring_to_feature(polygon_ring_t const &ring,
                               osmid_t relation_id);

/**
 * Writes the combined rings of multipolygons as a GeoJSON
 * FeatureCollection. Output is written feature by feature so it doesn't
 * have to be kept in memory.
 */
class geojson_writer_t
{
public:
    /// The file is not owned by this object and is not closed.
    explicit geojson_writer_t(std::FILE *out);

    geojson_writer_t(geojson_writer_t const &) = delete;
    geojson_writer_t &operator=(geojson_writer_t const &) = delete;

    geojson_writer_t(geojson_writer_t &&) = delete;
    geojson_writer_t &operator=(geojson_writer_t &&) = delete;

    ~geojson_writer_t() noexcept = default;

    /// Write all combined rings of this multipolygon.
    void add(multipolygon_t const &multipolygon);

    /// Finish the FeatureCollection. Must be called once at the end.
    void finish();

    std::size_t num_features() const noexcept { return m_count; }

private:
    std::FILE *m_out;
    std::size_t m_count = 0;
    bool m_finished = false;

}; // class geojson_writer_t

#endif // MPRING_GEOJSON_WRITER_HPP
