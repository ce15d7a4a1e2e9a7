/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/allocate_photons.hpp"

#include "libpscan/channels.hpp"
#include "libpscan/core.hpp"
#include "libpscan/data_types.hpp"
#include "libpscan/errors.hpp"
#include "libpscan/movie_config.hpp"
#include "libpscan/reconcile_markers.hpp"
#include "libpscan/test_utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace pscan {

namespace {

auto markers_of(std::vector<u64> lines, std::vector<u64> frames)
    -> reconciled_markers<> {
    reconciled_markers<> m;
    m.timing.line_delta = mean(successive_differences(lines));
    m.lines.abstime = std::move(lines);
    m.frames.abstime = std::move(frames);
    return m;
}

auto photons_on_pmt1(std::vector<u64> times) -> channel_data<> {
    channel_data<> data;
    data.insert(pmt_channel(1), event_table<>{std::move(times)});
    return data;
}

auto config(bool bidir, bool keep_unidir = false, double phase = 0.0)
    -> movie_config {
    movie_settings s;
    s.x_pixels = 4;
    s.y_pixels = 4;
    s.bidir = bidir;
    s.keep_unidir = keep_unidir;
    s.phase = phase;
    return movie_config(s);
}

} // namespace

TEST_CASE("allocate bidirectional scan") {
    auto const m = markers_of({0, 10, 20, 30}, {0});
    auto const data = photons_on_pmt1({2, 13, 27, 35});
    auto const r = allocate_photons(data, m, config(true), null_sink());
    auto const &p = r.photons;
    REQUIRE(p.size() == 4);
    CHECK(p.frame_start == std::vector<u64>{0, 0, 0, 0});
    CHECK(p.line_start == std::vector<u64>{0, 10, 20, 30});
    CHECK(p.time_rel_frames == std::vector<i64>{2, 13, 27, 35});
    // Odd lines count back from the next line start; the last line ends one
    // line spacing after it starts.
    CHECK(p.time_rel_line == std::vector{2.0, 7.0, 7.0, 5.0});
    CHECK(r.stats.input == 4);
    CHECK(r.stats.allocated == 4);
    CHECK(r.stats.dropped() == 0);
    CHECK_FALSE(p.has_phase);
    CHECK_FALSE(p.has_pulse_time);
}

TEST_CASE("allocate assigns the greatest preceding frame") {
    auto const m = markers_of(uniform_series<u64>(0, 10, 8), {0, 40});
    auto const data = photons_on_pmt1({39, 40, 41});
    auto const r = allocate_photons(data, m, config(true), null_sink());
    CHECK(r.photons.frame_start == std::vector<u64>{0, 40, 40});
    CHECK(r.photons.time_rel_frames == std::vector<i64>{39, 0, 1});
}

TEST_CASE("allocate drops photons before the first marker") {
    auto const m = markers_of({100, 110, 120, 130}, {100});
    auto const data = photons_on_pmt1({5, 50, 100, 104});
    auto const r = allocate_photons(data, m, config(true), null_sink());
    CHECK(r.stats.before_first_marker == 2);
    CHECK(r.stats.allocated == 2);
    CHECK(r.stats.input == r.stats.allocated + r.stats.dropped());
    CHECK(r.photons.abstime == std::vector<u64>{100, 104});
}

TEST_CASE("allocate drops negative line times after return-scan correction") {
    // sin(-pi/6) * 10 is -5: a photon 2 bins before the next line ends up at
    // -3.
    auto const phase = -std::asin(0.5);
    auto const m = markers_of({0, 10, 20, 30}, {0});
    auto const data = photons_on_pmt1({5, 12, 18});
    auto const r =
        allocate_photons(data, m, config(true, false, phase), null_sink());
    CHECK(r.stats.negative_line_time == 1);
    CHECK(r.photons.abstime == std::vector<u64>{5, 12});
    CHECK(std::none_of(r.photons.time_rel_line.begin(),
                       r.photons.time_rel_line.end(),
                       [](double t) { return t < 0.0; }));
}

TEST_CASE("allocate unidirectional scan") {
    auto const m = markers_of({0, 10, 20, 30}, {0});
    auto const data = photons_on_pmt1({2, 13, 27, 35});

    SECTION("return lines dropped") {
        auto const r = allocate_photons(data, m, config(false), null_sink());
        CHECK(r.stats.uneven_line_dropped == 2);
        CHECK(r.photons.abstime == std::vector<u64>{2, 27});
        CHECK(r.photons.time_rel_line == std::vector{2.0, 7.0});
    }

    SECTION("return lines folded into the preceding line") {
        auto const r =
            allocate_photons(data, m, config(false, true), null_sink());
        CHECK(r.stats.dropped() == 0);
        CHECK(r.photons.line_start == std::vector<u64>{0, 0, 20, 20});
        CHECK(r.photons.time_rel_line == std::vector{2.0, 13.0, 7.0, 15.0});
    }
}

TEST_CASE("allocate with phase markers") {
    using Catch::Matchers::WithinAbs;
    auto const m = markers_of(uniform_series<u64>(0, 100, 4), {0});
    auto data = photons_on_pmt1({10, 125, 150, 275});
    data.insert(tag_lens_channel,
                event_table<>{uniform_series<u64>(100, 100, 3)});
    warning_collector warnings;
    auto const r = allocate_photons(data, m, config(true), warnings);
    CHECK(r.stats.before_first_phase_marker == 1);
    REQUIRE(r.photons.has_phase);
    REQUIRE(r.photons.phase.size() == 3);
    CHECK_THAT(r.photons.phase[0], WithinAbs(1.0, 1e-12));
    CHECK_THAT(r.photons.phase[1], WithinAbs(0.0, 1e-12));
    CHECK_THAT(r.photons.phase[2], WithinAbs(-1.0, 1e-12));
    CHECK(warnings.size() == 0);

    SECTION("TAG Lens preferred over Phase") {
        data.insert(phase_channel, event_table<>{{0, 7, 14}});
        warning_collector w;
        auto const r2 = allocate_photons(data, m, config(true), w);
        CHECK(w.contains("using TAG Lens"));
        CHECK(r2.photons.phase == r.photons.phase);
    }
}

TEST_CASE("allocate with a single phase marker has no phase") {
    auto const m = markers_of(uniform_series<u64>(0, 100, 4), {0});
    auto data = photons_on_pmt1({10});
    data.insert(phase_channel, event_table<>{{5}});
    auto const r = allocate_photons(data, m, config(true), null_sink());
    CHECK_FALSE(r.photons.has_phase);
    CHECK(r.photons.size() == 1);
}

TEST_CASE("allocate with laser pulses") {
    auto m = markers_of(uniform_series<u64>(0, 100, 4), {0});
    m.laser = event_table<>{uniform_series<u64>(3, 10, 40)};
    auto const data = photons_on_pmt1({1, 15, 27, 399});
    auto const r = allocate_photons(data, m, config(true), null_sink());
    CHECK(r.stats.before_first_pulse == 1);
    REQUIRE(r.photons.has_pulse_time);
    CHECK(r.photons.time_rel_pulse == std::vector<i64>{2, 4, 6});
}

TEST_CASE("allocate multiple channels") {
    auto const m = markers_of(uniform_series<u64>(0, 10, 4), {0});
    channel_data<> data;
    data.insert(pmt_channel(1), event_table<>{{4, 22}});
    data.insert(pmt_channel(2), event_table<>{{1}});
    data.insert(pmt_channel(3), event_table<>{{2}});
    movie_settings s;
    s.x_pixels = 4;
    s.num_of_channels = 2;
    auto const r =
        allocate_photons(data, m, movie_config(s), null_sink());
    CHECK(r.photons.channel == std::vector<u32>{1, 1, 2});
    CHECK(r.stats.input == 3);

    SECTION("missing channel is reported") {
        s.num_of_channels = 4;
        warning_collector warnings;
        auto const r4 = allocate_photons(data, m, movie_config(s), warnings);
        CHECK(warnings.contains("PMT4"));
        CHECK(r4.photons.channel == std::vector<u32>{1, 1, 2, 3});
    }
}

TEST_CASE("allocate rejects non-monotonic photons") {
    auto const m = markers_of(uniform_series<u64>(0, 10, 4), {0});
    CHECK_THROWS_AS(allocate_photons(photons_on_pmt1({5, 3}), m,
                                     config(true), null_sink()),
                    data_validation_error);
}

} // namespace pscan
