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
#include "libpscan/volume_histogram.hpp"
#include "libpscan/volume_partition.hpp"

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>

namespace pscan {

void histogram_volume(benchmark::State &state) {
    synthetic_acquisition acq;
    acq.lines_per_frame = 512;
    acq.num_frames = 1;
    acq.line_spacing = 10000;
    acq.photon_offsets.clear();
    auto const per_line = state.range(0);
    for (std::int64_t i = 0; i < per_line; ++i)
        acq.photon_offsets.push_back(static_cast<u64>(5 + i * 9000 / per_line));

    movie_settings s;
    s.x_pixels = acq.lines_per_frame;
    s.y_pixels = 512;
    s.num_of_frames = acq.num_frames;
    movie_config const config(s);
    auto const data = make_synthetic_channels(acq);
    auto const markers = reconcile_markers(data, config, null_sink());
    auto const alloc = allocate_photons(data, markers, config, null_sink());
    volume_partitioner<> part(alloc.photons,
                              volume_start_times(markers, alloc.photons), 1);
    auto const slice = part.next();
    volume_histogram_builder<> const builder(config, markers, false, false);

    for ([[maybe_unused]] auto _ : state) {
        auto h = builder.build(*slice, null_sink());
        benchmark::DoNotOptimize(h.counts.data().data());
    }
    state.SetItemsProcessed(state.iterations() *
                            static_cast<std::int64_t>(slice->size()));
}

// NOLINTBEGIN

BENCHMARK(histogram_volume)->RangeMultiplier(4)->Range(1, 256);

// NOLINTEND

} // namespace pscan

BENCHMARK_MAIN(); // NOLINT
