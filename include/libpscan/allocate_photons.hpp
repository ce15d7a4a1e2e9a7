/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "channels.hpp"
#include "core.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "movie_config.hpp"
#include "photon_table.hpp"
#include "reconcile_markers.hpp"
#include "series_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pscan {

/**
 * \brief Counts of photons seen and dropped during allocation.
 *
 * \ingroup allocate
 */
struct allocation_stats {
    /** \brief Photons read from the detector channels. */
    std::size_t input = 0;

    /** \brief Photons kept in the allocated table. */
    std::size_t allocated = 0;

    /** \brief Photons earlier than the first frame or line marker. */
    std::size_t before_first_marker = 0;

    /** \brief Return-scan photons dropped in unidirectional mode. */
    std::size_t uneven_line_dropped = 0;

    /** \brief Photons whose corrected line time was negative. */
    std::size_t negative_line_time = 0;

    /** \brief Photons earlier than the first phase marker. */
    std::size_t before_first_phase_marker = 0;

    /** \brief Photons earlier than the first laser pulse. */
    std::size_t before_first_pulse = 0;

    /** \brief Return the total number of dropped photons. */
    [[nodiscard]] auto dropped() const noexcept -> std::size_t {
        return before_first_marker + uneven_line_dropped +
               negative_line_time + before_first_phase_marker +
               before_first_pulse;
    }

    /** \brief Equality comparison operator. */
    friend auto operator==(allocation_stats const &lhs,
                           allocation_stats const &rhs) noexcept -> bool {
        return lhs.input == rhs.input && lhs.allocated == rhs.allocated &&
               lhs.before_first_marker == rhs.before_first_marker &&
               lhs.uneven_line_dropped == rhs.uneven_line_dropped &&
               lhs.negative_line_time == rhs.negative_line_time &&
               lhs.before_first_phase_marker ==
                   rhs.before_first_phase_marker &&
               lhs.before_first_pulse == rhs.before_first_pulse;
    }
};

/**
 * \brief Allocated photons together with the allocation counts.
 *
 * \ingroup allocate
 */
template <typename DataTypes = default_data_types> struct allocation_result {
    /** \brief The allocated photons. */
    photon_table<DataTypes> photons;

    /** \brief What happened to the input photons. */
    allocation_stats stats;
};

namespace internal {

inline constexpr double two_pi = 6.283185307179586;

// Index of the greatest element <= value, if any.
template <typename T>
auto asof_index(std::vector<T> const &series, T value)
    -> std::optional<std::size_t> {
    auto const it = std::upper_bound(series.begin(), series.end(), value);
    if (it == series.begin())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(series.begin(), it)) - 1;
}

// Periodic marker train mapped to sin(2 pi (t - p_k) / period).
template <typename DataTypes> class phase_source {
    std::vector<typename DataTypes::abstime_type> const *markers;
    double period;

  public:
    explicit phase_source(
        std::vector<typename DataTypes::abstime_type> const &markers)
        : markers(&markers),
          period(median(successive_differences(markers))) {
        if (not(period > 0.0))
            throw data_validation_error(
                "phase markers have zero median period");
    }

    auto operator()(typename DataTypes::abstime_type t) const
        -> std::optional<double> {
        auto const k = asof_index(*markers, t);
        if (not k)
            return std::nullopt;
        auto const rel = static_cast<double>(t - (*markers)[*k]);
        return std::sin(two_pi * rel / period);
    }
};

template <typename DataTypes, typename WarningSink>
auto select_phase_channel(channel_data<DataTypes> const &channels,
                          WarningSink &warnings)
    -> event_table<DataTypes> const * {
    auto const usable = [&](channel_id id) {
        auto const *t = channels.find(id);
        return t != nullptr && t->size() >= 2 ? t : nullptr;
    };
    auto const *tag = usable(tag_lens_channel);
    auto const *phase = usable(phase_channel);
    if (tag != nullptr && phase != nullptr) {
        warnings.handle(warning_event{
            "both TAG Lens and Phase channels present; using TAG Lens"});
    }
    return tag != nullptr ? tag : phase;
}

} // namespace internal

/**
 * \brief Assign every photon to its containing frame and line.
 *
 * \ingroup allocate
 *
 * For each detector channel 1 to `num_of_channels`, each photon is assigned
 * the greatest frame start and the greatest line start not later than the
 * photon. Photons earlier than the first frame or line are dropped.
 *
 * The time relative to the line is then corrected for the scan direction.
 * Lines are numbered globally from 0; odd lines are return scans:
 * - In bidirectional mode, a photon on an odd line gets
 *   `(next line start - t) + sin(phase) * (lines[1] - lines[0])`, where the
 *   next line start of the last line is extrapolated by the line spacing.
 * - In unidirectional mode, photons on odd lines are dropped, or, with
 *   `keep_unidir`, reassigned to the preceding (even) line.
 *
 * Photons whose corrected line time is negative are dropped.
 *
 * If a `TAG Lens` or `Phase` channel with at least two markers is present,
 * each photon also gets a depth phase (see `pscan::movie_config`); photons
 * earlier than the first phase marker are dropped. If the reconciled markers
 * carry a laser pulse train, each photon gets its time relative to the
 * preceding pulse; photons earlier than the first pulse are dropped.
 *
 * \param channels the raw per-channel event tables
 *
 * \param markers the reconciled markers
 *
 * \param config the configuration
 *
 * \param warnings warning sink
 *
 * \throws data_validation_error if detector timestamps are not monotonic
 */
template <typename DataTypes = default_data_types, typename WarningSink>
auto allocate_photons(channel_data<DataTypes> const &channels,
                      reconciled_markers<DataTypes> const &markers,
                      movie_config const &config, WarningSink &&warnings)
    -> allocation_result<DataTypes> {
    using reltime_type = typename DataTypes::reltime_type;

    auto const &lines = markers.lines.abstime;
    auto const &frames = markers.frames.abstime;
    if (lines.empty() || frames.empty())
        throw data_validation_error("cannot allocate photons without lines "
                                    "and frames");

    std::optional<internal::phase_source<DataTypes>> phase;
    if (auto const *table = internal::select_phase_channel(channels, warnings))
        phase.emplace(table->abstime);
    auto const *pulses =
        markers.laser && not markers.laser->empty() ? &markers.laser->abstime
                                                    : nullptr;

    allocation_result<DataTypes> ret;
    auto &out = ret.photons;
    auto &stats = ret.stats;
    out.has_phase = phase.has_value();
    out.has_pulse_time = pulses != nullptr;

    auto const first_line_duration =
        lines.size() >= 2 ? static_cast<double>(lines[1] - lines[0]) : 0.0;
    auto const return_scan_offset =
        std::sin(config.phase()) * first_line_duration;
    auto const last_line_end =
        static_cast<double>(lines.back()) + markers.timing.line_delta;

    for (std::size_t ch = 1; ch <= config.num_of_channels(); ++ch) {
        auto const id = pmt_channel(static_cast<u32>(ch));
        auto const *table = channels.find(id);
        if (table == nullptr) {
            warnings.handle(warning_event{"no data for channel " +
                                          channel_name(id)});
            continue;
        }
        check_monotonic(table->abstime, channel_name(id));
        stats.input += table->size();
        out.reserve(out.size() + table->size());

        for (auto const t : table->abstime) {
            auto const fi = internal::asof_index(frames, t);
            auto li = internal::asof_index(lines, t);
            if (not fi || not li) {
                ++stats.before_first_marker;
                continue;
            }

            double rel_line = 0.0;
            if (*li % 2 == 0) {
                rel_line = static_cast<double>(t - lines[*li]);
            } else if (config.bidir()) {
                auto const next_start =
                    *li + 1 < lines.size()
                        ? static_cast<double>(lines[*li + 1])
                        : last_line_end;
                rel_line = (next_start - static_cast<double>(t)) +
                           return_scan_offset;
            } else if (config.keep_unidir()) {
                --*li;
                rel_line = static_cast<double>(t - lines[*li]);
            } else {
                ++stats.uneven_line_dropped;
                continue;
            }
            if (rel_line < 0.0) {
                ++stats.negative_line_time;
                continue;
            }

            photon_row<DataTypes> row{};
            if (phase) {
                auto const p = (*phase)(t);
                if (not p) {
                    ++stats.before_first_phase_marker;
                    continue;
                }
                row.phase = *p;
            }
            if (pulses != nullptr) {
                auto const k = internal::asof_index(*pulses, t);
                if (not k) {
                    ++stats.before_first_pulse;
                    continue;
                }
                row.time_rel_pulse =
                    static_cast<reltime_type>(t - (*pulses)[*k]);
            }

            row.channel = static_cast<u32>(ch);
            row.abstime = t;
            row.frame_start = frames[*fi];
            row.line_start = lines[*li];
            row.time_rel_frames = static_cast<reltime_type>(t - frames[*fi]);
            row.time_rel_line = rel_line;
            out.push_back(row);
        }
    }
    stats.allocated = out.size();
    return ret;
}

} // namespace pscan
