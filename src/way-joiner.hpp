#ifndef MPRING_WAY_JOINER_HPP
#define MPRING_WAY_JOINER_HPP

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
 * Code for joining open ways into longer chains by matching their end
 * nodes.
 */

#include "data-store.hpp"
#include "osmtypes.hpp"

#include <vector>

/**
 * A chain of ways joined at their end nodes.
 */
struct joined_way_t
{
    /// The node ids of the chain in order, shared end nodes appear once.
    idlist_t nodes;

    /// The ways this chain was built from, in the order they were joined.
    way_list_t ways;

    /// Is any of the ways in this chain selected?
    bool selected = false;

    /**
     * Is this chain closed, ie. is the first node the same as the last?
     * An empty chain counts as closed.
     */
    bool is_closed() const noexcept
    {
        return nodes.empty() || nodes.front() == nodes.back();
    }
};

/**
 * Join ways into chains. Ways are matched by the ids of their first and
 * last nodes in any orientation. Each chain is extended as long as some
 * unused way fits at its head or tail, then the next unused way starts a
 * new chain. Chains are returned in the order their first way appears in
 * the input. Chains that could not be closed are returned as they are.
 *
 * \param ways The ways to join. They should all be open ways.
 * \param store The store is asked whether ways are selected.
 */
std::vector<joined_way_t> join_ways(way_list_t const &ways,
                                    data_store_t const &store);

#endif // MPRING_WAY_JOINER_HPP
