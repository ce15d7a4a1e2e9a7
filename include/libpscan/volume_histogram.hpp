/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "arg_wrappers.hpp"
#include "core.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "histogram_edges.hpp"
#include "histogram_policies.hpp"
#include "movie_config.hpp"
#include "nd_array.hpp"
#include "reconcile_markers.hpp"
#include "series_stats.hpp"
#include "volume_partition.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Histogram of one (channel, volume) pair, with its bin edges.
 *
 * \ingroup volume-histogram
 *
 * Axes are, in order: volume (X, one bin per line), Y (position within the
 * line), Z (phase; only if the photons carry a phase) and laser (pulse time;
 * only if the photons carry pulse times).
 *
 * \tparam DataTypes data type set specifying `bin_type`
 */
template <typename DataTypes = default_data_types> struct volume_histogram {
    /** \brief Volume index. */
    std::size_t volume_index = 0;

    /** \brief Detector channel number. */
    u32 channel = 0;

    /** \brief Photon counts. */
    nd_array<typename DataTypes::bin_type> counts;

    /** \brief Bin edges per axis; empty vectors for an empty volume. */
    std::vector<std::vector<double>> edges;

    /** \brief Range and bin count per axis; default for an empty volume. */
    std::vector<axis_metadata> axes;

    /** \brief True if the volume held no photons. */
    bool empty = true;

    /** \brief True if any bin was clamped at the maximum count. */
    bool saturated = false;
};

/**
 * \brief Count the pixels holding more than one photon summed over the last
 * axis.
 *
 * \ingroup volume-histogram
 */
template <typename T>
auto count_multi_photon_pixels(nd_array<T> const &counts) -> std::size_t {
    if (counts.rank() == 0 || counts.size() == 0)
        return 0;
    auto const inner = counts.shape().back();
    std::size_t ret = 0;
    for (std::size_t base = 0; base < counts.size(); base += inner) {
        i64 total = 0;
        for (std::size_t i = 0; i < inner; ++i)
            total += counts[base + i];
        if (total > 1)
            ++ret;
    }
    return ret;
}

/**
 * \brief Builds the histogram of each (channel, volume) slice.
 *
 * \ingroup volume-histogram
 *
 * The Z and laser axes are fixed for the run. The X edges are computed per
 * volume from the line markers of the volume's frame, so that small variations
 * in line timing are followed and lines that received no photon still occupy
 * their pixel. In unidirectional mode only the even (forward) line markers
 * start scan lines. The Y axis is scaled from the run's line spacing.
 *
 * A photon is counted if all its coordinates fall within the edges (the last
 * bin of each axis includes its upper edge). Counts are of
 * `DataTypes::bin_type`; on overflow, the configured
 * `pscan::overflow_policy` applies.
 *
 * \tparam DataTypes data type set specifying `abstime_type` and `bin_type`
 */
template <typename DataTypes = default_data_types>
class volume_histogram_builder {
    using abstime_type = typename DataTypes::abstime_type;
    using bin_type = typename DataTypes::bin_type;
    static_assert(std::is_integral_v<bin_type>,
                  "bin_type must be an integer type");

    std::size_t x;
    std::size_t y;
    double fill_frac;
    bool bidir;
    overflow_policy overflow;
    bool censor;
    double line_delta;
    std::vector<abstime_type> scan_lines;
    std::vector<abstime_type> frame_starts;
    std::optional<std::vector<double>> z_edges;
    std::optional<std::vector<double>> laser_edges;

    // Line starts of the frame starting at the volume start, relative to it.
    [[nodiscard]] auto volume_line_starts(
        volume_slice<DataTypes> const &slice) const -> std::vector<double> {
        auto const begin = std::lower_bound(
            scan_lines.begin(), scan_lines.end(), slice.abs_start_time);
        auto const next_frame = std::upper_bound(
            frame_starts.begin(), frame_starts.end(), slice.abs_start_time);
        auto const end = next_frame == frame_starts.end()
                             ? scan_lines.end()
                             : std::lower_bound(begin, scan_lines.end(),
                                                *next_frame);
        std::vector<double> ret;
        ret.reserve(static_cast<std::size_t>(std::distance(begin, end)));
        for (auto it = begin; it != end; ++it) {
            ret.push_back(static_cast<double>(*it) -
                          static_cast<double>(slice.abs_start_time));
        }
        return unique_sorted(std::move(ret));
    }

  public:
    /**
     * \brief Construct from the configuration and the reconciled markers.
     *
     * \param config the configuration
     *
     * \param markers the reconciled markers (the lines and frames give the X
     * edges; `timing.line_delta` scales the Y axis and
     * `timing.bins_between_pulses` sizes the laser axis)
     *
     * \param has_phase whether to include the Z axis
     *
     * \param has_pulse_time whether to include the laser axis
     */
    explicit volume_histogram_builder(
        movie_config const &config,
        reconciled_markers<DataTypes> const &markers, bool has_phase,
        bool has_pulse_time)
        : x(config.x_pixels()), y(config.y_pixels()),
          fill_frac(config.fill_frac()), bidir(config.bidir()),
          overflow(config.overflow()), censor(config.censor()),
          line_delta(markers.timing.line_delta),
          frame_starts(unique_sorted(markers.frames.abstime)) {
        auto const &lines = markers.lines.abstime;
        if (bidir) {
            scan_lines = lines;
        } else {
            scan_lines.reserve(lines.size() / 2 + 1);
            for (std::size_t i = 0; i < lines.size(); i += 2)
                scan_lines.push_back(lines[i]);
        }
        if (has_phase)
            z_edges = z_axis_edges(arg::z_pixels<>{config.z_pixels()});
        if (has_pulse_time) {
            laser_edges =
                laser_axis_edges(markers.timing.bins_between_pulses);
        }
    }

    /** \brief Return the histogram shape used for every volume. */
    [[nodiscard]] auto shape() const -> std::vector<std::size_t> {
        std::vector<std::size_t> ret{x, y};
        if (z_edges)
            ret.push_back(z_edges->size() - 1);
        if (laser_edges)
            ret.push_back(laser_edges->size() - 1);
        return ret;
    }

    /** \brief Return the number of axes. */
    [[nodiscard]] auto rank() const -> std::size_t { return shape().size(); }

    /**
     * \brief Histogram one slice.
     *
     * An empty slice gives an all-zero histogram of `shape()` with empty
     * edge placeholders.
     *
     * \throws insufficient_data_error if the volume has too few lines
     *
     * \throws data_validation_error if edges are not strictly increasing
     *
     * \throws histogram_overflow_error on overflow under
     * `overflow_policy::error_on_overflow`
     */
    template <typename WarningSink>
    auto build(volume_slice<DataTypes> const &slice,
               WarningSink &&warnings) const -> volume_histogram<DataTypes> {
        volume_histogram<DataTypes> ret;
        ret.volume_index = slice.index;
        ret.channel = slice.channel;
        ret.counts = nd_array<bin_type>(shape());
        if (slice.empty || slice.photons == nullptr) {
            ret.edges.resize(rank());
            ret.axes.resize(rank());
            return ret;
        }
        auto const &p = *slice.photons;

        auto const line_starts = volume_line_starts(slice);
        auto const duration = static_cast<double>(slice.duration);

        std::optional<double> spacing;
        if (line_starts.size() > 1)
            spacing = line_delta;

        ret.edges.push_back(volume_axis_edges(
            line_starts, arg::x_pixels<>{x}, duration, warnings));
        ret.edges.push_back(y_axis_edges(spacing, duration,
                                         arg::y_pixels<>{y},
                                         arg::fill_fraction{fill_frac},
                                         bidir));
        if (z_edges)
            ret.edges.push_back(*z_edges);
        if (laser_edges)
            ret.edges.push_back(*laser_edges);

        std::vector<edge_bin_mapper> mappers;
        mappers.reserve(ret.edges.size());
        for (auto const &e : ret.edges) {
            ret.axes.push_back(describe_axis(e));
            mappers.emplace_back(e);
        }

        auto const &dims = ret.counts.shape();
        std::vector<double> coords(dims.size());
        for (auto i = slice.first; i < slice.last; ++i) {
            std::size_t a = 0;
            coords[a++] = static_cast<double>(p.time_rel_frames[i]);
            coords[a++] = p.time_rel_line[i];
            if (z_edges)
                coords[a++] = p.phase[i];
            if (laser_edges)
                coords[a++] = static_cast<double>(p.time_rel_pulse[i]);

            std::size_t flat = 0;
            bool in_range = true;
            for (std::size_t d = 0; d < dims.size(); ++d) {
                auto const bin = mappers[d](coords[d]);
                if (not bin) {
                    in_range = false;
                    break;
                }
                flat = flat * dims[d] + *bin;
            }
            if (not in_range)
                continue;

            auto &count = ret.counts[flat];
            if (count == std::numeric_limits<bin_type>::max()) {
                if (overflow == overflow_policy::error_on_overflow) {
                    throw histogram_overflow_error(
                        "histogram bin overflowed in volume " +
                        std::to_string(slice.index) + " of channel " +
                        std::to_string(slice.channel));
                }
                ret.saturated = true;
                continue;
            }
            ++count;
        }
        ret.empty = false;

        if (ret.saturated) {
            warnings.handle(warning_event{
                "histogram bins saturated in volume " +
                std::to_string(slice.index) + " of channel " +
                std::to_string(slice.channel)});
        }
        if (censor) {
            auto const n = count_multi_photon_pixels(ret.counts);
            if (n > 0) {
                warnings.handle(warning_event{
                    "censor correction: " + std::to_string(n) +
                    " pixels hold more than one photon; counts left "
                    "unchanged"});
            }
        }
        return ret;
    }
};

} // namespace pscan
