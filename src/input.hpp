#ifndef MPRING_INPUT_HPP
#define MPRING_INPUT_HPP

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
 * It contains the functions reading and checking the input data.
 */

#include "osmtypes.hpp"

#include <osmium/fwd.hpp>
#include <osmium/io/file.hpp>
#include <osmium/osm/item_type.hpp>

#include <string>

class ram_store_t;

struct type_id
{
    osmium::item_type type;
    osmid_t id;
};

/**
 * Compare two tuples (type, id). Throw a descriptive error if either the
 * curr id is negative or if the data is not ordered.
 */
type_id check_input(type_id const &last, type_id curr);

type_id check_input(type_id const &last, osmium::OSMObject const &object);

/**
 * Prepare input file. Does format checks as far as this is possible
 * without actually opening the file.
 *
 * \param filename Name of the file ("-" for stdin).
 * \param input_format Format of the file, empty for autodetection.
 */
osmium::io::File prepare_input_file(std::string const &filename,
                                    std::string const &input_format);

/**
 * Read all objects from the file into the store. Objects must be ordered
 * by type (nodes, then ways, then relations) and id.
 */
void process_file(osmium::io::File const &file, ram_store_t *store);

#endif // MPRING_INPUT_HPP
