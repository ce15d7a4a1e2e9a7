/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "allocate_photons.hpp"
#include "channels.hpp"
#include "common.hpp"
#include "data_types.hpp"
#include "movie.hpp"
#include "movie_config.hpp"
#include "movie_outputs.hpp"
#include "output_kinds.hpp"
#include "photon_table.hpp"
#include "reconcile_markers.hpp"
#include "volume_histogram.hpp"
#include "volume_partition.hpp"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Everything produced by `pscan::reconstruct_movie()`.
 *
 * \ingroup pipeline
 *
 * \tparam DataTypes data type set
 */
template <typename DataTypes = default_data_types> struct movie_result {
    /** \brief The reconciled markers and timing constants. */
    reconciled_markers<DataTypes> markers;

    /** \brief The allocated photons. */
    photon_table<DataTypes> photons;

    /** \brief What happened to the input photons. */
    allocation_stats stats;

    /** \brief Volume boundaries (number of volumes plus one). */
    std::vector<typename DataTypes::abstime_type> volume_times;

    /** \brief In-memory movie; null unless the `memory` output was
     * requested. */
    std::shared_ptr<movie_memory<DataTypes>> memory;

    /** \brief Number of (channel, volume) histograms produced. */
    std::size_t histograms_built = 0;
};

/**
 * \brief Reconstruct a movie from per-channel event tables.
 *
 * \ingroup pipeline
 *
 * Runs, in order: marker reconciliation, channel sanity checks, photon
 * allocation, volume partitioning, and histogramming into the requested
 * outputs. When any persisted output (`stack` or `summed`) was requested,
 * \p store is closed after all outputs have been flushed, or, if any stage
 * throws, before the exception propagates.
 *
 * \param channels the per-channel event tables
 *
 * \param config the configuration
 *
 * \param store destination of persisted outputs; may be null if no
 * persisted output is requested
 *
 * \param warnings warning sink
 *
 * \throws configuration_error if a persisted output is requested without a
 * store, or if reconciliation lacks a required setting
 *
 * \throws data_validation_error (or a derived type) if the data cannot be
 * reconstructed
 *
 * \throws histogram_overflow_error under
 * `overflow_policy::error_on_overflow`
 */
template <typename DataTypes = default_data_types, typename WarningSink>
auto reconstruct_movie(channel_data<DataTypes> const &channels,
                       movie_config const &config,
                       internal::type_identity_t<
                           std::shared_ptr<volume_store<DataTypes>>>
                           store,
                       WarningSink &&warnings) -> movie_result<DataTypes> {
    movie_result<DataTypes> ret;
    if (includes(config.outputs(), output_kind::memory))
        ret.memory = std::make_shared<movie_memory<DataTypes>>();
    auto const outputs =
        make_movie_outputs<DataTypes>(config.outputs(), ret.memory, store);

    bool const persisted = includes(config.outputs(), output_kind::stack) ||
                           includes(config.outputs(), output_kind::summed);
    try {
        ret.markers = reconcile_markers(channels, config, warnings);
        check_channel_counts(channels, ret.markers, warnings);

        auto allocated =
            allocate_photons(channels, ret.markers, config, warnings);
        ret.photons = std::move(allocated.photons);
        ret.stats = allocated.stats;

        ret.volume_times = volume_start_times(ret.markers, ret.photons);
        volume_partitioner<DataTypes> partitioner(
            ret.photons, ret.volume_times, config.num_of_channels());
        volume_histogram_builder<DataTypes> const builder(
            config, ret.markers, ret.photons.has_phase,
            ret.photons.has_pulse_time);
        ret.histograms_built =
            assemble_movie(partitioner, builder, outputs, warnings);
    } catch (...) {
        if (persisted)
            store->close();
        throw;
    }

    if (persisted)
        store->close();
    return ret;
}

} // namespace pscan
