/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/photon_table.hpp"

#include "libpscan/data_types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

namespace pscan {

TEST_CASE("photon_table stores optional columns only when present") {
    photon_row<> row{};
    row.channel = 2;
    row.abstime = 105;
    row.frame_start = 100;
    row.line_start = 104;
    row.time_rel_frames = 5;
    row.time_rel_line = 1.0;
    row.phase = 0.25;
    row.time_rel_pulse = 3;

    SECTION("without phase or pulse time") {
        photon_table<> t;
        t.push_back(row);
        CHECK(t.size() == 1);
        CHECK(t.phase.empty());
        CHECK(t.time_rel_pulse.empty());
        auto const r = t.row(0);
        CHECK(r.channel == 2);
        CHECK(r.line_start == 104);
        CHECK(r.phase == 0.0);
        CHECK(r.time_rel_pulse == 0);
    }

    SECTION("with phase and pulse time") {
        photon_table<> t;
        t.has_phase = true;
        t.has_pulse_time = true;
        t.push_back(row);
        auto const r = t.row(0);
        CHECK(r.phase == 0.25);
        CHECK(r.time_rel_pulse == 3);
        CHECK_THROWS_AS(t.row(1), std::out_of_range);
    }
}

} // namespace pscan
