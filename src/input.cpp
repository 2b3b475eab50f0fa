/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "input.hpp"

#include "format.hpp"
#include "logging.hpp"
#include "ram-store.hpp"

#include <osmium/io/any_input.hpp>
#include <osmium/visitor.hpp>

#include <array>
#include <cassert>
#include <stdexcept>

type_id check_input(type_id const &last, type_id curr)
{
    if (curr.id < 0) {
        throw fmt_error("Negative OSM object ids are not allowed: {} id {}.",
                        osmium::item_type_to_name(curr.type), curr.id);
    }

    if (last.type == curr.type) {
        if (last.id < curr.id) {
            return curr;
        }

        if (last.id > curr.id) {
            throw fmt_error("Input data is not ordered: {} id {} after {}.",
                            osmium::item_type_to_name(last.type), curr.id,
                            last.id);
        }

        throw fmt_error("Input data is not ordered:"
                        " {} id {} appears more than once.",
                        osmium::item_type_to_name(last.type), curr.id);
    }

    if (osmium::item_type_to_nwr_index(last.type) <=
        osmium::item_type_to_nwr_index(curr.type)) {
        return curr;
    }

    throw fmt_error("Input data is not ordered: {} after {}.",
                    osmium::item_type_to_name(curr.type),
                    osmium::item_type_to_name(last.type));
}

type_id check_input(type_id const &last, osmium::OSMObject const &object)
{
    return check_input(last, {object.type(), object.id()});
}

osmium::io::File prepare_input_file(std::string const &filename,
                                    std::string const &input_format)
{
    osmium::io::File file{filename, input_format};

    if (file.format() == osmium::io::file_format::unknown) {
        if (input_format.empty()) {
            throw fmt_error("Cannot detect file format for '{}'."
                            " Try using --input-format.",
                            filename);
        }
        throw fmt_error("Unknown file format '{}'.", input_format);
    }

    if (file.has_multiple_object_versions()) {
        throw std::runtime_error{"Reading OSM change files is not supported."};
    }

    log_debug("Reading file: {}", filename);

    return file;
}

void process_file(osmium::io::File const &file, ram_store_t *store)
{
    assert(store);

    osmium::io::Reader reader{file};
    type_id last{osmium::item_type::node, 0};
    std::array<std::size_t, 3> counts{};

    while (osmium::memory::Buffer buffer = reader.read()) {
        for (auto &object : buffer.select<osmium::OSMObject>()) {
            last = check_input(last, object);
            osmium::apply_item(object, *store);
            ++counts[osmium::item_type_to_nwr_index(object.type())];
        }
    }

    reader.close();

    log_info("Read {} nodes, {} ways, and {} relations.", counts[0],
             counts[1], counts[2]);
}
