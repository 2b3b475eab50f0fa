/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "command-line-app.hpp"
#include "format.hpp"
#include "geojson-writer.hpp"
#include "input.hpp"
#include "logging.hpp"
#include "multipolygon.hpp"
#include "ram-store.hpp"
#include "role-config.hpp"
#include "role-matcher.hpp"
#include "util.hpp"
#include "version.hpp"

#include <osmium/osm/relation.hpp>
#include <osmium/util/string.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class command_t
{
    help,
    version,
    process
};

struct config_t
{
    std::string input_file;
    std::string input_format;
    std::string output_file;
    std::string role_config_file;
    role_settings_t role_settings;
    std::vector<osmid_t> relations;
    std::vector<osmid_t> selected_ways;
    command_t command = command_t::process;
};

std::vector<std::string> split_list(std::string const &arg)
{
    return osmium::split_string(arg, ',', true);
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,hicpp-avoid-c-arrays,modernize-avoid-c-arrays)
config_t parse_command_line(int argc, char *argv[])
{
    config_t cfg;

    command_line_app_t app{
        "mpring -- Assemble the rings of multipolygon relations\n"};
    app.init_logging_options();

    app.get_formatter()->column_width(38);

    app.add_option("OSMFILE", cfg.input_file)
        ->description("Input file ('-' for stdin)")
        ->type_name("FILE");

    app.add_option("--input-format", cfg.input_format)
        ->description("Input format ('xml', 'pbf', 'opl', default: autodetect)")
        ->type_name("FORMAT");

    app.add_option("-o,--output", cfg.output_file)
        ->description("Write GeoJSON to this file (default: stdout)")
        ->type_name("FILE");

    app.add_option("-r,--relation", cfg.relations)
        ->description("Only assemble relation with this id (can be given "
                      "multiple times)")
        ->type_name("ID");

    app.add_option("-s,--select-way", cfg.selected_ways)
        ->description("Mark way with this id as selected (can be given "
                      "multiple times)")
        ->type_name("ID");

    app.add_option("--role-config", cfg.role_config_file)
        ->description("Read role settings from this JSON file")
        ->type_name("FILE")
        ->group("Role options");

    app.add_option_function<std::string>(
           "--outer-roles",
           [&](std::string const &arg) {
               cfg.role_settings.outer_exact_roles = split_list(arg);
           })
        ->description("Comma separated list of outer roles (default: "
                      "'outer')")
        ->type_name("ROLES")
        ->group("Role options");

    app.add_option_function<std::string>(
           "--outer-role-prefixes",
           [&](std::string const &arg) {
               cfg.role_settings.outer_role_prefixes = split_list(arg);
           })
        ->description("Comma separated list of outer role prefixes")
        ->type_name("PREFIXES")
        ->group("Role options");

    app.add_option_function<std::string>(
           "--inner-roles",
           [&](std::string const &arg) {
               cfg.role_settings.inner_exact_roles = split_list(arg);
           })
        ->description("Comma separated list of inner roles (default: "
                      "'inner')")
        ->type_name("ROLES")
        ->group("Role options");

    app.add_option_function<std::string>(
           "--inner-role-prefixes",
           [&](std::string const &arg) {
               cfg.role_settings.inner_role_prefixes = split_list(arg);
           })
        ->description("Comma separated list of inner role prefixes")
        ->type_name("PREFIXES")
        ->group("Role options");

    try {
        app.parse(argc, argv);
    } catch (...) {
        log_info("mpring version {}", get_mpring_version());
        throw;
    }

    if (app.want_help()) {
        std::cout << app.help();
        cfg.command = command_t::help;
        return cfg;
    }

    if (app.want_version()) {
        cfg.command = command_t::version;
        return cfg;
    }

    if (cfg.input_file.empty()) {
        throw std::runtime_error{"Missing input file. Try 'mpring --help'."};
    }

    return cfg;
}

std::shared_ptr<role_config_t const> create_role_config(config_t const &cfg)
{
    role_settings_t settings;
    if (!cfg.role_config_file.empty()) {
        log_info("Reading role settings from '{}'...", cfg.role_config_file);
        settings = read_role_settings(cfg.role_config_file);
    }
    settings.override_with(cfg.role_settings);

    auto config = std::make_shared<role_config_t const>(settings);

    log_info("Role settings:");
    log_info("  outer roles: {}",
             util::join(config->outer_exact_roles(), ',', '\''));
    log_info("  outer role prefixes: {}",
             util::join(config->outer_role_prefixes(), ',', '\''));
    log_info("  inner roles: {}",
             util::join(config->inner_exact_roles(), ',', '\''));
    log_info("  inner role prefixes: {}",
             util::join(config->inner_role_prefixes(), ',', '\''));

    return config;
}

bool is_area_relation(osmium::Relation const &relation)
{
    char const *const type = relation.tags()["type"];
    if (!type) {
        return false;
    }
    return std::strcmp(type, "multipolygon") == 0 ||
           std::strcmp(type, "boundary") == 0;
}

struct file_closer
{
    void operator()(std::FILE *file) const noexcept { std::fclose(file); }
};

using output_file_t = std::unique_ptr<std::FILE, file_closer>;

output_file_t open_output(std::string const &filename)
{
    if (filename.empty() || filename == "-") {
        return {};
    }

    output_file_t file{std::fopen(filename.c_str(), "w")};
    if (!file) {
        throw fmt_error("Can not open output file '{}': {}.", filename,
                        std::strerror(errno));
    }
    return file;
}

void assemble(config_t const &cfg, ram_store_t const &store,
              role_matcher_t const &role_matcher)
{
    auto const output = open_output(cfg.output_file);
    geojson_writer_t writer{output ? output.get() : stdout};

    std::size_t count = 0;
    auto const add = [&](osmium::Relation const &relation) {
        multipolygon_t const multipolygon{relation, store, role_matcher};
        log_debug("Relation {}: {} outer ways, {} inner ways, {} rings.",
                  relation.id(), multipolygon.outer_ways().size(),
                  multipolygon.inner_ways().size(),
                  multipolygon.combined_rings().size());
        writer.add(multipolygon);
        ++count;
    };

    if (cfg.relations.empty()) {
        for (auto const id : store.relation_ids()) {
            auto const *relation = store.relation_get(id);
            if (relation && is_area_relation(*relation)) {
                add(*relation);
            }
        }
    } else {
        for (auto const id : cfg.relations) {
            auto const *relation = store.relation_get(id);
            if (relation) {
                add(*relation);
            } else {
                log_warn("Relation {} not found in input.", id);
            }
        }
    }

    writer.finish();

    if (output && std::fflush(output.get()) != 0) {
        throw fmt_error("Writing output file '{}' failed: {}.",
                        cfg.output_file, std::strerror(errno));
    }

    log_info("Assembled {} relations into {} rings.", count,
             writer.num_features());
}

} // anonymous namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char *argv[])
{
    try {
        auto const cfg = parse_command_line(argc, argv);

        if (cfg.command == command_t::help) {
            // Already handled inside parse_command_line()
            return 0;
        }

        if (cfg.command == command_t::version) {
            print_version("mpring");
            return 0;
        }

        log_info("mpring version {}", get_mpring_version());

        util::timer_t timer;

        role_matcher_t const role_matcher{create_role_config(cfg)};

        auto const file = prepare_input_file(cfg.input_file, cfg.input_format);

        ram_store_t store;
        process_file(file, &store);

        for (auto const id : cfg.selected_ways) {
            store.select_way(id);
        }

        store.log_stats();

        assemble(cfg, store, role_matcher);

        log_info("mpring took {} overall.",
                 util::human_readable_duration(timer.stop()));
    } catch (std::exception const &e) {
        log_error("{}", e.what());
        return 1;
    }

    return 0;
}
