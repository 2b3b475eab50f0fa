/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "way-joiner.hpp"

#include "logging.hpp"

#include <cassert>

namespace {

/**
 * Where to attach a way to a chain: The first part of the name is the end
 * of the chain, the second part the end of the way that are the same node.
 */
enum class join_mode
{
    none,
    tail_head,
    tail_tail,
    head_head,
    head_tail
};

/**
 * Find out whether and how the way can be attached to the chain. While the
 * chain only consists of its first way, attaching at the tail of the chain
 * is preferred, later appending in way direction is tried first.
 */
join_mode find_join_mode(idlist_t const &chain, osmium::Way const &way,
                         bool only_seed) noexcept
{
    auto const &wnl = way.nodes();
    if (chain.empty() || wnl.empty()) {
        return join_mode::none;
    }

    osmid_t const chain_head = chain.front();
    osmid_t const chain_tail = chain.back();
    osmid_t const way_head = wnl.front().ref();
    osmid_t const way_tail = wnl.back().ref();

    if (only_seed) {
        if (chain_tail == way_head) {
            return join_mode::tail_head;
        }
        if (chain_tail == way_tail) {
            return join_mode::tail_tail;
        }
        if (chain_head == way_head) {
            return join_mode::head_head;
        }
        if (chain_head == way_tail) {
            return join_mode::head_tail;
        }
        return join_mode::none;
    }

    if (chain_tail == way_head) {
        return join_mode::tail_head;
    }
    if (chain_head == way_tail) {
        return join_mode::head_tail;
    }
    if (chain_head == way_head) {
        return join_mode::head_head;
    }
    if (chain_tail == way_tail) {
        return join_mode::tail_tail;
    }
    return join_mode::none;
}

/**
 * Add the nodes of the way to the chain. The shared node is removed from
 * the chain first, so it only appears once.
 */
void splice(idlist_t *chain, osmium::Way const &way, join_mode mode)
{
    assert(chain && !chain->empty());

    auto const &wnl = way.nodes();
    idlist_t nodes{wnl};

    switch (mode) {
    case join_mode::tail_head:
        chain->pop_back();
        chain->insert(chain->end(), nodes.cbegin(), nodes.cend());
        break;
    case join_mode::tail_tail:
        chain->pop_back();
        chain->insert(chain->end(), nodes.crbegin(), nodes.crend());
        break;
    case join_mode::head_head:
        chain->erase(chain->begin());
        chain->insert(chain->begin(), nodes.crbegin(), nodes.crend());
        break;
    case join_mode::head_tail:
        chain->erase(chain->begin());
        chain->insert(chain->begin(), nodes.cbegin(), nodes.cend());
        break;
    case join_mode::none:
        break;
    }
}

} // anonymous namespace

std::vector<joined_way_t> join_ways(way_list_t const &ways,
                                    data_store_t const &store)
{
    std::vector<joined_way_t> result;

    // Ways already used are set to nullptr in this list.
    way_list_t pool{ways};
    std::size_t left = pool.size();

    while (left != 0) {
        joined_way_t chain;
        bool joined = true;

        while (joined && left != 0) {
            joined = false;
            for (auto &candidate : pool) {
                if (!candidate) {
                    continue;
                }

                if (chain.ways.empty()) {
                    chain.nodes = idlist_t{candidate->nodes()};
                    chain.selected = store.way_selected(candidate->id());
                    chain.ways.push_back(candidate);
                    candidate = nullptr;
                    --left;
                    continue;
                }

                auto const mode = find_join_mode(chain.nodes, *candidate,
                                                 chain.ways.size() == 1);
                if (mode == join_mode::none) {
                    continue;
                }

                splice(&chain.nodes, *candidate, mode);
                if (store.way_selected(candidate->id())) {
                    chain.selected = true;
                }
                chain.ways.push_back(candidate);
                candidate = nullptr;
                --left;
                joined = true;
            }
        }

        log_debug("Joined {} way(s) into {} chain with {} nodes.",
                  chain.ways.size(), chain.is_closed() ? "closed" : "open",
                  chain.nodes.size());
        result.push_back(std::move(chain));
    }

    return result;
}
