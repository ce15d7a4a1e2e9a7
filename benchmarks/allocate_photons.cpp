/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/allocate_photons.hpp"
#include "libpscan/core.hpp"
#include "libpscan/movie_config.hpp"
#include "libpscan/reconcile_markers.hpp"
#include "libpscan/test_utils.hpp"

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>

namespace pscan {

namespace {

auto make_acquisition(std::int64_t photons_per_line) -> synthetic_acquisition {
    synthetic_acquisition acq;
    acq.lines_per_frame = 256;
    acq.num_frames = 8;
    acq.line_spacing = 5000;
    acq.photon_offsets.clear();
    for (std::int64_t i = 0; i < photons_per_line; ++i)
        acq.photon_offsets.push_back(static_cast<u64>(10 + i * 4900 /
                                                      photons_per_line));
    return acq;
}

auto make_config(synthetic_acquisition const &acq) -> movie_config {
    movie_settings s;
    s.x_pixels = acq.lines_per_frame;
    s.y_pixels = 256;
    s.num_of_frames = acq.num_frames;
    return movie_config(s);
}

} // namespace

void allocate_bidirectional(benchmark::State &state) {
    auto const acq = make_acquisition(state.range(0));
    auto const config = make_config(acq);
    auto const data = make_synthetic_channels(acq);
    auto const markers = reconcile_markers(data, config, null_sink());
    for ([[maybe_unused]] auto _ : state) {
        auto r = allocate_photons(data, markers, config, null_sink());
        benchmark::DoNotOptimize(r.photons.time_rel_line.data());
    }
    state.SetItemsProcessed(state.iterations() *
                            static_cast<std::int64_t>(
                                acq.lines_per_frame * acq.num_frames *
                                acq.photon_offsets.size()));
}

void reconcile_synthesized_lines(benchmark::State &state) {
    auto acq = make_acquisition(1);
    acq.record_lines = false;
    acq.num_frames = static_cast<std::size_t>(state.range(0));
    auto const config = make_config(acq);
    auto const data = make_synthetic_channels(acq);
    for ([[maybe_unused]] auto _ : state) {
        auto m = reconcile_markers(data, config, null_sink());
        benchmark::DoNotOptimize(m.lines.abstime.data());
    }
}

// NOLINTBEGIN

BENCHMARK(allocate_bidirectional)->RangeMultiplier(4)->Range(1, 64);

BENCHMARK(reconcile_synthesized_lines)->RangeMultiplier(4)->Range(1, 256);

// NOLINTEND

} // namespace pscan

BENCHMARK_MAIN(); // NOLINT
