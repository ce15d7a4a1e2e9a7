/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/volume_histogram.hpp"

#include "libpscan/allocate_photons.hpp"
#include "libpscan/channels.hpp"
#include "libpscan/core.hpp"
#include "libpscan/data_types.hpp"
#include "libpscan/errors.hpp"
#include "libpscan/histogram_policies.hpp"
#include "libpscan/movie_config.hpp"
#include "libpscan/photon_table.hpp"
#include "libpscan/reconcile_markers.hpp"
#include "libpscan/test_utils.hpp"
#include "libpscan/volume_partition.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace pscan {

namespace {

auto synthetic_config() -> movie_settings {
    movie_settings s;
    s.x_pixels = 4;
    s.y_pixels = 2;
    s.num_of_frames = 3;
    s.fill_frac = 100.0;
    return s;
}

template <typename DataTypes>
auto single_pixel_slice(photon_table<DataTypes> const &photons)
    -> volume_slice<DataTypes> {
    volume_slice<DataTypes> s;
    s.index = 0;
    s.channel = 1;
    s.abs_start_time = 0;
    s.duration = 100;
    s.empty = photons.empty();
    s.photons = &photons;
    s.first = 0;
    s.last = photons.size();
    return s;
}

template <typename DataTypes>
auto stacked_photons(std::size_t count) -> photon_table<DataTypes> {
    photon_table<DataTypes> t;
    for (std::size_t i = 0; i < count; ++i) {
        photon_row<DataTypes> row{};
        row.channel = 1;
        row.abstime = 5;
        row.time_rel_frames = 5;
        row.time_rel_line = 5.0;
        t.push_back(row);
    }
    return t;
}

// Markers of a single frame at time 0 with the given line starts.
template <typename DataTypes = default_data_types>
auto single_frame_markers(std::vector<u64> const &lines)
    -> reconciled_markers<DataTypes> {
    reconciled_markers<DataTypes> m;
    m.lines.abstime = lines;
    m.frames.abstime = {0};
    if (lines.size() > 1)
        m.timing.line_delta = static_cast<double>(lines[1] - lines[0]);
    m.timing.bins_between_pulses = 4;
    return m;
}

// Lines every 100 bins, 4 per frame, over 3 frames; one photon 10 bins after
// each given line start.
auto sparse_acquisition(std::vector<u64> const &occupied_lines)
    -> channel_data<> {
    channel_data<> ret;
    ret.insert(lines_channel,
               event_table<>{uniform_series<u64>(0, 100, 12)});
    ret.insert(frames_channel, event_table<>{{0, 400, 800}});
    event_table<> photons;
    for (auto const l : occupied_lines)
        photons.abstime.push_back(l + 10);
    ret.insert(pmt_channel(1), std::move(photons));
    return ret;
}

auto single_pixel_config(overflow_policy overflow, bool censor = false)
    -> movie_config {
    movie_settings s;
    s.x_pixels = 1;
    s.y_pixels = 1;
    s.overflow = overflow;
    s.censor = censor;
    return movie_config(s);
}

} // namespace

TEST_CASE("volume histogram of synthetic acquisition") {
    auto const config = movie_config(synthetic_config());
    auto const data = make_synthetic_channels(synthetic_acquisition{});
    auto const markers = reconcile_markers(data, config, null_sink());
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    volume_histogram_builder<> const builder(config, markers, false, false);
    CHECK(builder.shape() == std::vector<std::size_t>{4, 2});

    std::size_t volumes = 0;
    while (auto const slice = part.next()) {
        warning_collector warnings;
        auto const h = builder.build(*slice, warnings);
        CHECK_FALSE(h.empty);
        CHECK(h.volume_index == volumes);
        REQUIRE(h.counts.shape() == std::vector<std::size_t>{4, 2});
        // Forward lines put both photons in the first half, return lines in
        // the second half.
        CHECK(h.counts.data() == std::vector<i16>{2, 0, 0, 2, 2, 0, 0, 2});
        CHECK(h.counts.sum<i64>() == static_cast<i64>(slice->size()));
        REQUIRE(h.axes.size() == 2);
        CHECK(h.axes[0] == axis_metadata{0.0, 400.0, 4});
        CHECK(h.axes[1] == axis_metadata{0.0, 100.0, 2});
        CHECK(warnings.size() == 0);

        ++volumes;
    }
    CHECK(volumes == 3);
}

TEST_CASE("volume histogram drops photons outside the edges") {
    auto s = synthetic_config();
    s.fill_frac = 50.0;
    auto const config = movie_config(s);
    auto const data = make_synthetic_channels(synthetic_acquisition{});
    auto const markers = reconcile_markers(data, config, null_sink());
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    volume_histogram_builder<> const builder(config, markers, false, false);
    auto const slice = part.next();
    REQUIRE(slice.has_value());
    auto const h = builder.build(*slice, null_sink());
    // Only the forward-line photons (at 10 and 40) fall within 0 to 50.
    CHECK(h.counts.data() == std::vector<i16>{1, 1, 0, 0, 1, 1, 0, 0});
    CHECK(h.counts.sum<i64>() < static_cast<i64>(slice->size()));
}

TEST_CASE("volume histogram with zero fill fraction spans the line") {
    auto s = synthetic_config();
    s.fill_frac = 0.0;
    auto const config = movie_config(s);
    auto const data = make_synthetic_channels(synthetic_acquisition{});
    auto const markers = reconcile_markers(data, config, null_sink());
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    volume_histogram_builder<> const builder(config, markers, false, false);
    auto const slice = part.next();
    REQUIRE(slice.has_value());
    auto const h = builder.build(*slice, null_sink());
    CHECK(h.axes[1] == axis_metadata{0.0, 100.0, 2});
    CHECK(h.counts.data() == std::vector<i16>{2, 0, 0, 2, 2, 0, 0, 2});
}

TEST_CASE("empty volume histogram") {
    movie_settings s;
    s.x_pixels = 3;
    s.y_pixels = 5;
    s.z_pixels = 2;
    volume_histogram_builder<> const builder(
        movie_config(s), single_frame_markers({}), true, true);
    photon_table<> const photons;
    auto const h = builder.build(single_pixel_slice(photons), null_sink());
    CHECK(h.empty);
    CHECK(h.counts.shape() == std::vector<std::size_t>{3, 5, 2, 4});
    CHECK(h.counts.sum<i64>() == 0);
    REQUIRE(h.edges.size() == 4);
    for (auto const &e : h.edges)
        CHECK(e.empty());
}

TEST_CASE("volume histogram with phase and pulse axes") {
    photon_table<> photons;
    photons.has_phase = true;
    photons.has_pulse_time = true;
    photon_row<> row{};
    row.channel = 1;
    row.time_rel_frames = 5;
    row.time_rel_line = 5.0;
    row.phase = 0.5;
    row.time_rel_pulse = 3;
    photons.push_back(row);

    movie_settings s;
    s.x_pixels = 1;
    s.y_pixels = 1;
    s.z_pixels = 2;
    volume_histogram_builder<> const builder(
        movie_config(s), single_frame_markers({0}), true, true);
    auto const h = builder.build(single_pixel_slice(photons), null_sink());
    REQUIRE(h.counts.shape() == std::vector<std::size_t>{1, 1, 2, 4});
    CHECK(h.counts.at({0, 0, 1, 3}) == 1);
    CHECK(h.counts.sum<i64>() == 1);
    CHECK(h.axes[2] == axis_metadata{-1.0, 1.0, 2});
    CHECK(h.axes[3] == axis_metadata{0.0, 4.0, 4});
}

TEST_CASE("volume histogram with too few lines") {
    photon_table<> photons;
    for (u64 line : {0, 100}) {
        photon_row<> row{};
        row.channel = 1;
        row.line_start = line;
        row.time_rel_frames = static_cast<i64>(line) + 1;
        row.time_rel_line = 1.0;
        photons.push_back(row);
    }
    movie_settings s;
    s.x_pixels = 4;
    s.y_pixels = 1;
    volume_histogram_builder<> const builder(
        movie_config(s), single_frame_markers({0, 100}), false, false);
    CHECK_THROWS_AS(builder.build(single_pixel_slice(photons), null_sink()),
                    insufficient_data_error);
}

TEST_CASE("volume histogram overflow") {
    struct data_types : default_data_types {
        using bin_type = i8;
    };
    auto const photons = stacked_photons<data_types>(130);
    auto const markers = single_frame_markers<data_types>({0});

    SECTION("saturate") {
        volume_histogram_builder<data_types> const builder(
            single_pixel_config(overflow_policy::saturate_on_overflow),
            markers, false, false);
        warning_collector warnings;
        auto const h = builder.build(single_pixel_slice(photons), warnings);
        CHECK(h.saturated);
        CHECK(h.counts.at({0, 0}) == 127);
        CHECK(warnings.contains("saturated"));
        // The single-line volume is also reported.
        CHECK(warnings.contains("single line"));
    }

    SECTION("error") {
        volume_histogram_builder<data_types> const builder(
            single_pixel_config(overflow_policy::error_on_overflow),
            markers, false, false);
        CHECK_THROWS_AS(
            builder.build(single_pixel_slice(photons), null_sink()),
            histogram_overflow_error);
    }
}

TEST_CASE("censor pass leaves counts unchanged") {
    auto const photons = stacked_photons<default_data_types>(3);
    volume_histogram_builder<> const builder(
        single_pixel_config(overflow_policy::saturate_on_overflow, true),
        single_frame_markers({0}), false, false);
    warning_collector warnings;
    auto const h = builder.build(single_pixel_slice(photons), warnings);
    CHECK(h.counts.at({0, 0}) == 3);
    CHECK(warnings.contains("censor correction: 1 pixels"));
}

TEST_CASE("volume histogram keeps pixels of lines without photons") {
    auto const run = [](channel_data<> const &data, movie_settings s) {
        s.y_pixels = 1;
        s.lines_per_frame = 4;
        s.num_of_frames = 3;
        s.fill_frac = 100.0;
        movie_config const config(s);
        auto const markers = reconcile_markers(data, config, null_sink());
        auto const alloc =
            allocate_photons(data, markers, config, null_sink());
        volume_partitioner<> part(
            alloc.photons, volume_start_times(markers, alloc.photons), 1);
        volume_histogram_builder<> const builder(config, markers, false,
                                                 false);
        std::vector<std::vector<i16>> ret;
        while (auto const slice = part.next())
            ret.push_back(builder.build(*slice, null_sink()).counts.data());
        return ret;
    };

    SECTION("one empty line in the first volume") {
        // Line 2 (at 200) has no photon.
        std::vector<u64> occupied;
        for (u64 l = 0; l < 1200; l += 100) {
            if (l != 200)
                occupied.push_back(l);
        }
        movie_settings s;
        s.x_pixels = 4;
        auto const counts = run(sparse_acquisition(occupied), s);
        REQUIRE(counts.size() == 3);
        CHECK(counts[0] == std::vector<i16>{1, 1, 0, 1});
        CHECK(counts[1] == std::vector<i16>{1, 1, 1, 1});
        CHECK(counts[2] == std::vector<i16>{1, 1, 1, 1});
    }

    SECTION("empty line among the first x lines") {
        // Line 1 (at 100) is empty; only the first 2 lines are imaged.
        movie_settings s;
        s.x_pixels = 2;
        auto const counts = run(sparse_acquisition({0, 200, 300}), s);
        REQUIRE(counts.size() == 3);
        CHECK(counts[0] == std::vector<i16>{1, 0});
    }
}

TEST_CASE("volume histogram of unidirectional scan") {
    auto s = synthetic_config();
    s.bidir = false;
    s.x_pixels = 2;
    s.lines_per_frame = 2;
    auto const config = movie_config(s);
    auto const data = make_synthetic_channels(synthetic_acquisition{});
    auto const markers = reconcile_markers(data, config, null_sink());
    REQUIRE(markers.timing.line_delta == 100.0);
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    volume_histogram_builder<> const builder(config, markers, false, false);
    auto const slice = part.next();
    REQUIRE(slice.has_value());
    auto const h = builder.build(*slice, null_sink());
    // Forward lines at 0 and 200; the Y axis spans half the line spacing.
    CHECK(h.axes[0] == axis_metadata{0.0, 400.0, 2});
    CHECK(h.axes[1] == axis_metadata{0.0, 50.0, 2});
    CHECK(h.counts.data() == std::vector<i16>{1, 1, 1, 1});
}

TEST_CASE("volume histogram is reproducible") {
    auto const config = movie_config(synthetic_config());
    auto const data = make_synthetic_channels(synthetic_acquisition{});
    auto const markers = reconcile_markers(data, config, null_sink());
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    volume_histogram_builder<> const builder(config, markers, false, false);
    while (auto const slice = part.next()) {
        auto const first = builder.build(*slice, null_sink());
        auto const second = builder.build(*slice, null_sink());
        CHECK(second.counts == first.counts);
        CHECK(second.edges == first.edges);
        CHECK(second.axes == first.axes);
        CHECK(second.empty == first.empty);
    }
}

TEST_CASE("count_multi_photon_pixels") {
    nd_array<i16> const a({2, 2, 2}, {1, 0, 1, 1, 0, 0, 2, 0});
    CHECK(count_multi_photon_pixels(a) == 2);
    CHECK(count_multi_photon_pixels(nd_array<i16>{}) == 0);
}

} // namespace pscan
