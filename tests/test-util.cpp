/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "util.hpp"

TEST_CASE("join strings", "[NoDB]")
{
    REQUIRE(util::join({}, ',').empty());
    REQUIRE(util::join({"outer"}, ',') == "outer");
    REQUIRE(util::join({"a", "b", "c"}, ',') == "a,b,c");
    REQUIRE(util::join({"", "b"}, ',') == ",b");
}

TEST_CASE("join strings with quotes", "[NoDB]")
{
    REQUIRE(util::join({}, ',', '\'').empty());
    REQUIRE(util::join({"inner", "enclave"}, ',', '\'') ==
            "'inner','enclave'");
}

TEST_CASE("human readable durations", "[NoDB]")
{
    REQUIRE(util::human_readable_duration(0) == "0s");
    REQUIRE(util::human_readable_duration(59) == "59s");
    REQUIRE(util::human_readable_duration(75) == "75s (1m 15s)");
    REQUIRE(util::human_readable_duration(3600) == "3600s (1h 0m 0s)");
    REQUIRE(util::human_readable_duration(3725) == "3725s (1h 2m 5s)");
    REQUIRE(util::human_readable_duration(std::chrono::microseconds{
                90'000'000}) == "90s (1m 30s)");
}

TEST_CASE("timer measures elapsed time", "[NoDB]")
{
    util::timer_t timer;
    REQUIRE(timer.elapsed().count() == 0);

    auto const duration = timer.stop();
    REQUIRE(duration.count() >= 0);
    REQUIRE(timer.elapsed() == duration);
}
