/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "arg_wrappers.hpp"
#include "common.hpp"
#include "core.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "movie_outputs.hpp"
#include "output_kinds.hpp"
#include "photon_table.hpp"
#include "volume_histogram.hpp"
#include "volume_partition.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Create the output handlers for the requested output kinds.
 *
 * \ingroup movie
 *
 * Handlers are created in the order memory, stack, summed.
 *
 * \param kinds the requested outputs
 *
 * \param memory destination of the `memory` output; required if requested
 *
 * \param store destination of the `stack` and `summed` outputs; required if
 * either is requested
 *
 * \throws configuration_error if a required destination is null
 */
template <typename DataTypes = default_data_types>
auto make_movie_outputs(
    output_kind kinds,
    internal::type_identity_t<std::shared_ptr<movie_memory<DataTypes>>> memory,
    internal::type_identity_t<std::shared_ptr<volume_store<DataTypes>>> store)
    -> std::vector<std::unique_ptr<movie_output<DataTypes>>> {
    std::vector<std::unique_ptr<movie_output<DataTypes>>> ret;
    if (includes(kinds, output_kind::memory)) {
        if (not memory)
            throw configuration_error(
                "invalid configuration: memory output needs a destination");
        ret.push_back(
            std::make_unique<memory_output<DataTypes>>(std::move(memory)));
    }
    bool const persist = includes(kinds, output_kind::stack) ||
                         includes(kinds, output_kind::summed);
    if (persist && not store)
        throw configuration_error(
            "invalid configuration: stack and summed outputs need a "
            "volume_store");
    if (includes(kinds, output_kind::stack))
        ret.push_back(std::make_unique<stack_output<DataTypes>>(store));
    if (includes(kinds, output_kind::summed))
        ret.push_back(std::make_unique<summed_output<DataTypes>>(store));
    return ret;
}

/**
 * \brief Histogram every (channel, volume) pair and hand the results to the
 * outputs.
 *
 * \ingroup movie
 *
 * Slices are taken from \p partitioner from the start, in order; each is
 * histogrammed and passed to every output before the next slice is
 * histogrammed. After the last slice, every output is flushed.
 *
 * If \p outputs is empty, a warning is emitted and nothing is histogrammed.
 *
 * Any exception from histogramming propagates; no output is flushed in that
 * case.
 *
 * \return the number of histograms produced
 */
template <typename DataTypes = default_data_types, typename WarningSink>
auto assemble_movie(
    volume_partitioner<DataTypes> &partitioner,
    volume_histogram_builder<DataTypes> const &builder,
    std::vector<std::unique_ptr<movie_output<DataTypes>>> const &outputs,
    WarningSink &&warnings) -> std::size_t {
    if (outputs.empty()) {
        warnings.handle(warning_event{
            "no outputs requested; the photon table was allocated but no "
            "movie was built"});
        return 0;
    }
    partitioner.reset();
    std::size_t count = 0;
    while (auto const slice = partitioner.next()) {
        auto hist = builder.build(*slice, warnings);
        volume_histogram_event<DataTypes> const event{
            hist.channel, hist.volume_index, std::move(hist.counts)};
        for (auto const &out : outputs)
            out->handle(event);
        ++count;
    }
    for (auto const &out : outputs)
        out->flush();
    return count;
}

/**
 * \brief Compute the mean number of photons per laser pulse, per channel.
 *
 * \ingroup movie
 *
 * The number of pulses is the movie duration (the last volume boundary) in
 * seconds times the repetition rate.
 *
 * \throws std::invalid_argument if the number of pulses is not positive
 */
template <typename DataTypes = default_data_types>
auto photons_per_pulse(
    photon_table<DataTypes> const &photons,
    std::vector<typename DataTypes::abstime_type> const &volume_times,
    arg::bin_width<double> binwidth, arg::rep_rate<double> reprate)
    -> std::map<u32, double> {
    if (volume_times.empty())
        throw std::invalid_argument("photons_per_pulse needs volume times");
    auto const pulses = static_cast<double>(volume_times.back()) *
                        binwidth.value * reprate.value;
    if (not(pulses > 0.0))
        throw std::invalid_argument(
            "photons_per_pulse: movie spans no laser pulses");

    std::map<u32, std::size_t> counts;
    for (auto const ch : photons.channel)
        ++counts[ch];
    std::map<u32, double> ret;
    for (auto const &[ch, n] : counts)
        ret.emplace(ch, static_cast<double>(n) / pulses);
    return ret;
}

} // namespace pscan
