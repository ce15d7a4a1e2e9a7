/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "data_types.hpp"
#include "errors.hpp"
#include "photon_table.hpp"
#include "reconcile_markers.hpp"
#include "series_stats.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Compute the volume boundaries of a movie.
 *
 * \ingroup partition
 *
 * The boundaries are the distinct reconciled frame starts followed by one
 * closing boundary. With two or more volumes, the closing boundary is the
 * last frame start plus the median frame spacing. With a single volume, it is
 * the frame start plus the largest photon time relative to the frame, or (if
 * there are no photons) the remaining time up to the last event time.
 *
 * \return `num_volumes + 1` strictly increasing boundaries
 */
template <typename DataTypes = default_data_types>
auto volume_start_times(reconciled_markers<DataTypes> const &markers,
                        photon_table<DataTypes> const &photons)
    -> std::vector<typename DataTypes::abstime_type> {
    using abstime_type = typename DataTypes::abstime_type;
    auto times = unique_sorted(markers.frames.abstime);
    if (times.empty())
        throw data_validation_error("no frames to partition into volumes");

    if (times.size() >= 2) {
        auto const gap = median(successive_differences(times));
        times.push_back(times.back() + static_cast<abstime_type>(gap));
        return times;
    }

    abstime_type span = 0;
    if (not photons.empty()) {
        auto const m = *std::max_element(photons.time_rel_frames.begin(),
                                         photons.time_rel_frames.end());
        if (m > 0)
            span = static_cast<abstime_type>(m);
    } else if (markers.timing.last_event_time > times.front()) {
        span = markers.timing.last_event_time - times.front();
    }
    times.push_back(times.front() + std::max(span, abstime_type{1}));
    return times;
}

/**
 * \brief The photons of one (channel, volume) pair.
 *
 * \ingroup partition
 *
 * Refers to rows `[first, last)` of a photon table, which must outlive the
 * slice.
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> struct volume_slice {
    /** \brief Volume index, from 0. */
    std::size_t index = 0;

    /** \brief Detector channel number, from 1. */
    u32 channel = 0;

    /** \brief Absolute start time of the volume. */
    typename DataTypes::abstime_type abs_start_time = 0;

    /** \brief Duration of the volume, in bins. */
    typename DataTypes::abstime_type duration = 0;

    /** \brief True if no photon of the channel falls in the volume. */
    bool empty = true;

    /** \brief The photon table. */
    photon_table<DataTypes> const *photons = nullptr;

    /** \brief First row of the slice. */
    std::size_t first = 0;

    /** \brief One past the last row of the slice. */
    std::size_t last = 0;

    /** \brief Return the number of photons in the slice. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return last - first;
    }
};

/**
 * \brief Yields the photons of each (channel, volume) pair in order.
 *
 * \ingroup partition
 *
 * Iterates channels 1 to `num_of_channels` and, within each channel, volumes
 * in time order. Every pair is produced, including those without photons
 * (marked empty), so that consumers see a complete, ordered sequence.
 *
 * The partitioner holds only a cursor; `reset()` restarts the sequence.
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> class volume_partitioner {
    using abstime_type = typename DataTypes::abstime_type;

    photon_table<DataTypes> const *photons;
    std::vector<abstime_type> boundaries;
    std::size_t channels;

    std::size_t next_channel = 1;
    std::size_t next_volume = 0;

  public:
    /**
     * \brief Construct with photons and volume boundaries.
     *
     * \param photons the allocated photon table; must outlive this object
     *
     * \param volume_times volume boundaries, as returned by
     * `pscan::volume_start_times()`
     *
     * \param num_of_channels number of detector channels to iterate
     */
    explicit volume_partitioner(photon_table<DataTypes> const &photons,
                                std::vector<abstime_type> volume_times,
                                std::size_t num_of_channels)
        : photons(&photons), boundaries(std::move(volume_times)),
          channels(num_of_channels) {
        if (boundaries.size() < 2)
            throw std::invalid_argument(
                "volume_partitioner requires at least 2 volume boundaries");
        if (std::adjacent_find(boundaries.begin(), boundaries.end(),
                               std::greater_equal<>()) != boundaries.end())
            throw std::invalid_argument(
                "volume_partitioner boundaries must be strictly increasing");
    }

    /** \brief Return the number of volumes per channel. */
    [[nodiscard]] auto num_volumes() const noexcept -> std::size_t {
        return boundaries.size() - 1;
    }

    /** \brief Return the number of channels iterated. */
    [[nodiscard]] auto num_channels() const noexcept -> std::size_t {
        return channels;
    }

    /** \brief Return the volume boundaries. */
    [[nodiscard]] auto volume_times() const noexcept
        -> std::vector<abstime_type> const & {
        return boundaries;
    }

    /**
     * \brief Return the next (channel, volume) slice, or `std::nullopt`
     * after the last volume of the last channel.
     */
    auto next() -> std::optional<volume_slice<DataTypes>> {
        if (next_channel > channels)
            return std::nullopt;

        volume_slice<DataTypes> ret;
        ret.index = next_volume;
        ret.channel = static_cast<u32>(next_channel);
        ret.abs_start_time = boundaries[next_volume];
        ret.duration = boundaries[next_volume + 1] - boundaries[next_volume];
        ret.photons = photons;

        auto const &ch = photons->channel;
        auto const ch_range =
            std::equal_range(ch.begin(), ch.end(), ret.channel);
        auto const &fs = photons->frame_start;
        auto const lo = std::next(fs.begin(), ch_range.first - ch.begin());
        auto const hi = std::next(fs.begin(), ch_range.second - ch.begin());
        auto const frame_range =
            std::equal_range(lo, hi, ret.abs_start_time);
        ret.first =
            static_cast<std::size_t>(frame_range.first - fs.begin());
        ret.last = static_cast<std::size_t>(frame_range.second - fs.begin());
        ret.empty = ret.first == ret.last;

        if (++next_volume == num_volumes()) {
            next_volume = 0;
            ++next_channel;
        }
        return ret;
    }

    /** \brief Restart from the first volume of the first channel. */
    void reset() noexcept {
        next_channel = 1;
        next_volume = 0;
    }
};

} // namespace pscan
