#ifndef MPRING_RAM_STORE_HPP
#define MPRING_RAM_STORE_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "data-store.hpp"
#include "node-store.hpp"
#include "osmtypes.hpp"

#include <osmium/handler.hpp>
#include <osmium/memory/buffer.hpp>
#include <osmium/osm.hpp>

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * Implementation of the data store working completely in memory. It is an
 * osmium handler, so it can be filled directly from an osmium reader.
 *
 * Node locations go into the node store. Ways and relations are copied
 * into an osmium buffer and indexed by id. If an object with the same id is
 * added again, the index will point to the new version.
 */
class ram_store_t : public osmium::handler::Handler, public data_store_t
{
public:
    ram_store_t() = default;

    ram_store_t(ram_store_t const &) = delete;
    ram_store_t &operator=(ram_store_t const &) = delete;

    ram_store_t(ram_store_t &&) = delete;
    ram_store_t &operator=(ram_store_t &&) = delete;

    ~ram_store_t() noexcept override = default;

    void node(osmium::Node const &node);
    void way(osmium::Way const &way);
    void relation(osmium::Relation const &relation);

    osmium::Way const *way_get(osmid_t id) const override;

    osmium::Relation const *relation_get(osmid_t id) const override;

    bool way_selected(osmid_t id) const override;

    bool way_drawable(osmium::Way const &way) const override;

    node_store_t const &node_store() const noexcept override
    {
        return m_node_store;
    }

    /// Mark the way as selected or not selected.
    void select_way(osmid_t id, bool selected = true);

    /**
     * Move an existing node to a new location. The caller is responsible
     * for notifying the multipolygons using this node.
     *
     * \return True if the node exists.
     */
    bool move_node(osmid_t id, osmium::Location location);

    /// Ids of all relations in the order they were added first.
    std::vector<osmid_t> const &relation_ids() const noexcept
    {
        return m_relation_ids;
    }

    std::size_t num_ways() const noexcept { return m_way_index.size(); }

    std::size_t num_relations() const noexcept
    {
        return m_relation_index.size();
    }

    /// Log some statistics about memory use on the debug level.
    void log_stats() const;

private:
    std::size_t store_object(osmium::OSMObject const &object);

    /// For storing the location of all nodes.
    node_store_t m_node_store;

    /// Buffer for all ways and relations we store.
    osmium::memory::Buffer m_object_buffer{
        1024 * 1024, osmium::memory::Buffer::auto_grow::yes};

    /// Indexes into object buffer.
    std::unordered_map<osmid_t, std::size_t> m_way_index;
    std::unordered_map<osmid_t, std::size_t> m_relation_index;

    std::vector<osmid_t> m_relation_ids;

    std::unordered_set<osmid_t> m_selected_ways;

}; // class ram_store_t

#endif // MPRING_RAM_STORE_HPP
