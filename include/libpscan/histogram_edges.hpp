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
#include "series_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Range and bin count of one histogram axis.
 *
 * \ingroup histogram-edges
 */
struct axis_metadata {
    /** \brief First edge. */
    double start = 0.0;

    /** \brief Last edge. */
    double end = 0.0;

    /** \brief Number of bins. */
    std::size_t num_bins = 0;

    /** \brief Equality comparison operator. */
    friend auto operator==(axis_metadata const &lhs,
                           axis_metadata const &rhs) noexcept -> bool {
        return lhs.start == rhs.start && lhs.end == rhs.end &&
               lhs.num_bins == rhs.num_bins;
    }
};

/**
 * \brief Return \p num evenly spaced values from \p start to \p stop
 * inclusive.
 *
 * \ingroup histogram-edges
 */
inline auto linspace(double start, double stop, std::size_t num)
    -> std::vector<double> {
    std::vector<double> ret;
    if (num == 0)
        return ret;
    ret.reserve(num);
    if (num == 1) {
        ret.push_back(start);
        return ret;
    }
    auto const step = (stop - start) / static_cast<double>(num - 1);
    for (std::size_t i = 0; i + 1 < num; ++i)
        ret.push_back(start + static_cast<double>(i) * step);
    ret.push_back(stop);
    return ret;
}

/**
 * \brief Throw if histogram edges are not strictly increasing.
 *
 * \ingroup histogram-edges
 *
 * \throws data_validation_error if there are fewer than 2 edges or the edges
 * are not strictly increasing
 */
inline void check_edges(std::vector<double> const &edges,
                        std::string const &axis) {
    if (edges.size() < 2)
        throw data_validation_error(axis + " axis needs at least 2 edges");
    for (std::size_t i = 1; i < edges.size(); ++i) {
        if (not(edges[i] > edges[i - 1]))
            throw data_validation_error(
                axis + " axis edges are not strictly increasing");
    }
}

/**
 * \brief Return the metadata of an axis given its edges.
 *
 * \ingroup histogram-edges
 */
inline auto describe_axis(std::vector<double> const &edges) -> axis_metadata {
    if (edges.empty())
        return {};
    return {edges.front(), edges.back(), edges.size() - 1};
}

/**
 * \brief Bin mapper for arbitrary (strictly increasing) bin edges.
 *
 * \ingroup histogram-edges
 *
 * Bin `i` covers `[edges[i], edges[i + 1])`, except that the last bin also
 * includes its upper edge. Values outside `[edges.front(), edges.back()]` are
 * not mapped.
 */
class edge_bin_mapper {
    std::vector<double> edges;

  public:
    /**
     * \brief Construct with edges.
     *
     * \throws data_validation_error if the edges are not strictly increasing
     */
    explicit edge_bin_mapper(std::vector<double> bin_edges)
        : edges(std::move(bin_edges)) {
        check_edges(edges, "bin mapper");
    }

    /** \brief Implements bin mapper requirement. */
    [[nodiscard]] auto n_bins() const -> std::size_t {
        return edges.size() - 1;
    }

    /** \brief Implements bin mapper requirement. */
    auto operator()(double value) const -> std::optional<std::size_t> {
        if (not(value >= edges.front()) || value > edges.back())
            return std::nullopt;
        if (value == edges.back())
            return n_bins() - 1;
        auto const it = std::upper_bound(edges.begin(), edges.end(), value);
        return static_cast<std::size_t>(it - edges.begin()) - 1;
    }
};

/**
 * \brief Compute the edges of the volume (X) axis.
 *
 * \ingroup histogram-edges
 *
 * Each pixel along X is one scan line. \p line_starts are the distinct line
 * start times of the volume, relative to its start, in increasing order.
 * - With a single line and a single X pixel, the edges span the line start to
 *   the end of the volume, and a warning is emitted.
 * - Otherwise the first `x_pixels` lines give the lower edges, and the last
 *   edge is the last used line start plus the mean line spacing.
 *
 * \throws insufficient_data_error if fewer lines than `x_pixels` are
 * available
 */
template <typename WarningSink>
auto volume_axis_edges(std::vector<double> const &line_starts,
                       arg::x_pixels<> x_pixels, double volume_duration,
                       WarningSink &&warnings) -> std::vector<double> {
    if (x_pixels.value == 0)
        throw std::invalid_argument("x_pixels must be positive");
    if (line_starts.size() == 1 && x_pixels.value == 1) {
        warnings.handle(warning_event{
            "volume contains a single line; using a single-pixel line "
            "spanning the volume"});
        std::vector<double> edges{line_starts.front(),
                                  line_starts.front() + volume_duration};
        check_edges(edges, "volume");
        return edges;
    }
    if (line_starts.size() < 2 || line_starts.size() < x_pixels.value) {
        throw insufficient_data_error(
            "volume has " + std::to_string(line_starts.size()) +
            " lines, fewer than the " + std::to_string(x_pixels.value) +
            " pixels requested");
    }
    auto const spacing = mean(successive_differences(line_starts));
    std::vector<double> edges(
        line_starts.begin(),
        std::next(line_starts.begin(), static_cast<long>(x_pixels.value)));
    edges.push_back(edges.back() + spacing);
    check_edges(edges, "volume");
    return edges;
}

/**
 * \brief Compute the edges of the Y axis (position within a line).
 *
 * \ingroup histogram-edges
 *
 * The axis spans 0 to the line spacing times the fill fraction, truncated to
 * a whole bin; in unidirectional mode only half the spacing is used. A fill
 * fraction of 0 means the whole spacing. Without a line spacing (at most one
 * distinct line in the volume), the axis spans the whole volume instead.
 */
inline auto y_axis_edges(std::optional<double> line_spacing,
                         double volume_duration, arg::y_pixels<> y_pixels,
                         arg::fill_fraction<double> fill_frac, bool bidir)
    -> std::vector<double> {
    if (y_pixels.value == 0)
        throw std::invalid_argument("y_pixels must be positive");
    double end = volume_duration;
    if (line_spacing) {
        auto const delta = bidir ? *line_spacing : *line_spacing / 2.0;
        end = std::trunc(fill_frac.value > 0.0
                             ? delta * fill_frac.value / 100.0
                             : delta);
    }
    auto edges = linspace(0.0, end, y_pixels.value + 1);
    check_edges(edges, "Y");
    return edges;
}

/**
 * \brief Compute the edges of the Z (phase) axis.
 *
 * \ingroup histogram-edges
 */
inline auto z_axis_edges(arg::z_pixels<> z_pixels) -> std::vector<double> {
    if (z_pixels.value == 0)
        throw std::invalid_argument("z_pixels must be positive");
    return linspace(-1.0, 1.0, z_pixels.value + 1);
}

/**
 * \brief Compute the edges of the laser (pulse time) axis: one bin per
 * multiscaler bin between pulses.
 *
 * \ingroup histogram-edges
 */
inline auto laser_axis_edges(u64 bins_between_pulses) -> std::vector<double> {
    if (bins_between_pulses == 0)
        throw std::invalid_argument("bins_between_pulses must be positive");
    auto const nb = static_cast<std::size_t>(bins_between_pulses);
    return linspace(0.0, static_cast<double>(nb), nb + 1);
}

} // namespace pscan
