/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "nesting-resolver.hpp"

#include "logging.hpp"

#include <cassert>

polygon_ring_t *find_outer_ring(polygon_ring_t const &inner,
                                std::vector<polygon_ring_t> *outers)
{
    assert(outers);

    // First try to use only the bounding boxes, use the precise geometry
    // only if we don't get a unique result.
    auto const &inner_box = inner.bounds();
    polygon_ring_t *inside_ring = nullptr;
    polygon_ring_t *intersecting_ring = nullptr;
    std::size_t inside_count = 0;
    std::size_t intersecting_count = 0;

    for (auto &outer : *outers) {
        if (outer.bounds().contains(inner_box)) {
            inside_ring = &outer;
            ++inside_count;
        } else if (outer.bounds().intersects(inner_box)) {
            intersecting_ring = &outer;
            ++intersecting_count;
        }
    }

    if (inside_count == 1) {
        return inside_ring;
    }

    if (intersecting_count == 1) {
        return intersecting_ring;
    }

    log_debug("Bounding boxes not conclusive ({} inside, {} intersecting),"
              " checking ring geometries.",
              inside_count, intersecting_count);

    polygon_ring_t *result = nullptr;
    for (auto &outer : *outers) {
        if (outer.contains(inner.path()) == ring_relation::outside) {
            continue;
        }
        if (!result ||
            result->contains(outer.path()) != ring_relation::inside) {
            result = &outer;
        }
    }

    return result;
}

std::vector<polygon_ring_t>
combine_rings(std::vector<polygon_ring_t> &&outers,
              std::vector<std::shared_ptr<polygon_ring_t>> const &inners)
{
    assert(!outers.empty());

    if (inners.empty()) {
        return std::move(outers);
    }

    std::vector<polygon_ring_t> combined;

    if (outers.size() == 1) {
        combined.push_back(outers.front().clone());
        for (auto const &inner : inners) {
            combined.front().add_inner(inner);
        }
        return combined;
    }

    combined.reserve(outers.size());
    for (auto const &outer : outers) {
        combined.push_back(outer.clone());
    }

    for (auto const &inner : inners) {
        auto *outer = find_outer_ring(*inner, &combined);
        if (!outer) {
            log_debug("No outer ring found for inner ring with {} nodes,"
                      " using first outer ring.",
                      inner->nodes().size());
            outer = &combined.front();
        }
        outer->add_inner(inner);
    }

    return combined;
}
