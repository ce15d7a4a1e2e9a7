/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/volume_partition.hpp"

#include "libpscan/data_types.hpp"
#include "libpscan/errors.hpp"
#include "libpscan/photon_table.hpp"
#include "libpscan/reconcile_markers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace pscan {

namespace {

void add_photon(photon_table<> &t, u32 channel, u64 frame_start,
                u64 abstime) {
    photon_row<> row{};
    row.channel = channel;
    row.abstime = abstime;
    row.frame_start = frame_start;
    row.line_start = frame_start;
    row.time_rel_frames = static_cast<i64>(abstime - frame_start);
    t.push_back(row);
}

} // namespace

TEST_CASE("volume_start_times") {
    reconciled_markers<> m;
    photon_table<> photons;

    SECTION("several frames get a closing boundary at the median gap") {
        m.frames.abstime = {0, 100, 100, 210, 300};
        auto const times = volume_start_times(m, photons);
        CHECK(times == std::vector<u64>{0, 100, 210, 300, 400});
        // One boundary per distinct frame, plus the closing one.
        CHECK(times.size() == 4 + 1);
    }

    SECTION("single frame closes after the latest photon") {
        m.frames.abstime = {50};
        add_photon(photons, 1, 50, 80);
        add_photon(photons, 1, 50, 120);
        CHECK(volume_start_times(m, photons) == std::vector<u64>{50, 120});
    }

    SECTION("single frame without photons closes at last event time") {
        m.frames.abstime = {50};
        m.timing.last_event_time = 500;
        CHECK(volume_start_times(m, photons) == std::vector<u64>{50, 500});
    }

    SECTION("no frames") {
        CHECK_THROWS_AS(volume_start_times(m, photons),
                        data_validation_error);
    }
}

TEST_CASE("volume_partitioner yields every channel and volume in order") {
    photon_table<> photons;
    add_photon(photons, 1, 0, 5);
    add_photon(photons, 1, 0, 7);
    add_photon(photons, 1, 200, 201);
    add_photon(photons, 2, 100, 150);

    volume_partitioner<> part(photons, {0, 100, 200, 300}, 2);
    CHECK(part.num_volumes() == 3);
    CHECK(part.num_channels() == 2);

    struct expected {
        u32 channel;
        std::size_t index;
        u64 start;
        std::size_t size;
    };
    std::vector<expected> const want{{1, 0, 0, 2},   {1, 1, 100, 0},
                                     {1, 2, 200, 1}, {2, 0, 0, 0},
                                     {2, 1, 100, 1}, {2, 2, 200, 0}};
    for (auto const &w : want) {
        auto const s = part.next();
        REQUIRE(s.has_value());
        CHECK(s->channel == w.channel);
        CHECK(s->index == w.index);
        CHECK(s->abs_start_time == w.start);
        CHECK(s->duration == 100);
        CHECK(s->size() == w.size);
        CHECK(s->empty == (w.size == 0));
        CHECK(s->photons == &photons);
        for (auto i = s->first; i < s->last; ++i) {
            CHECK(photons.channel[i] == w.channel);
            CHECK(photons.frame_start[i] == w.start);
        }
    }
    CHECK_FALSE(part.next().has_value());
    CHECK_FALSE(part.next().has_value());

    SECTION("reset restarts") {
        part.reset();
        auto const s = part.next();
        REQUIRE(s.has_value());
        CHECK(s->channel == 1);
        CHECK(s->index == 0);
    }
}

TEST_CASE("volume_partitioner with no photons") {
    photon_table<> const photons;
    volume_partitioner<> part(photons, {0, 10}, 1);
    auto const s = part.next();
    REQUIRE(s.has_value());
    CHECK(s->empty);
    CHECK_FALSE(part.next().has_value());
}

TEST_CASE("volume_partitioner rejects bad boundaries") {
    photon_table<> const photons;
    CHECK_THROWS_AS(volume_partitioner<>(photons, {0}, 1),
                    std::invalid_argument);
    CHECK_THROWS_AS(volume_partitioner<>(photons, {0, 10, 10}, 1),
                    std::invalid_argument);
}

} // namespace pscan
