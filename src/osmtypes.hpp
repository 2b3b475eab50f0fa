#ifndef MPRING_OSMTYPES_HPP
#define MPRING_OSMTYPES_HPP

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
 * In this file some basic (OSM) data types are defined.
 */

#include <osmium/osm/node_ref_list.hpp>
#include <osmium/osm/way.hpp>

#include <cstdint>
#include <vector>

using osmid_t = std::int64_t;

/// An ordered list of node ids, used for rings and joined ways.
struct idlist_t : public std::vector<osmid_t>
{
    // Get all constructors from std::vector
    using vector<osmid_t>::vector;

    // Even though we got all constructors from std::vector we need this on
    // some compilers/libraries for some reason.
    idlist_t() = default;

    explicit idlist_t(osmium::NodeRefList const &list)
    {
        reserve(list.size());
        for (auto const &n : list) {
            push_back(n.ref());
        }
    }
};

/// Non-owning list of ways. The ways are owned by the data store.
using way_list_t = std::vector<osmium::Way const *>;

#endif // MPRING_OSMTYPES_HPP
