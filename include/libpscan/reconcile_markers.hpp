/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "arg_wrappers.hpp"
#include "channels.hpp"
#include "common.hpp"
#include "core.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "movie_config.hpp"
#include "series_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Repetition rate assumed when the configured rate is zero or invalid.
 *
 * \ingroup reconcile
 */
inline constexpr double default_reprate = 80.3e6;

/**
 * \brief Percent change in line spacing above which a line is suspicious.
 *
 * \ingroup reconcile
 */
inline constexpr double line_corruption_threshold_pct = 15.0;

/**
 * \brief Percent change in frame spacing above which a frame is suspicious.
 *
 * \ingroup reconcile
 */
inline constexpr double frame_corruption_threshold_pct = 5.0;

/**
 * \brief Fraction of suspicious markers above which a series is corrupt.
 *
 * \ingroup reconcile
 */
inline constexpr double corruption_max_fraction = 0.1;

/**
 * \brief Number of marker spacings over which spacing change is measured.
 *
 * \ingroup reconcile
 */
inline constexpr std::size_t corruption_window = 10;

/**
 * \brief Relative offset of the first line, compared to the line spacing,
 * within which a line at time zero is assumed to be missing.
 *
 * \ingroup reconcile
 */
inline constexpr double zeroth_line_tolerance = 0.05;

/**
 * \brief Fraction of laser pulses that may be discarded without a warning.
 *
 * \ingroup reconcile
 */
inline constexpr double max_discarded_pulse_fraction = 0.1;

/**
 * \brief Scalar timing parameters derived once per run.
 *
 * \ingroup reconcile
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> struct timing_constants {
    /** \brief Mean bins between consecutive line starts. */
    double line_delta = 0.0;

    /** \brief Bins spanning the whole experiment. */
    typename DataTypes::abstime_type last_event_time = 0;

    /** \brief Bins between laser pulses (1 when not in FLIM mode). */
    u64 bins_between_pulses = 1;

    /** \brief Laser repetition rate actually used, in Hz. */
    double reprate = 0.0;

    /** \brief Multiscaler bin width, in seconds. */
    double binwidth = 0.0;
};

/**
 * \brief Result of marker reconciliation.
 *
 * \ingroup reconcile
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> struct reconciled_markers {
    /** \brief Line start times, non-decreasing. */
    event_table<DataTypes> lines;

    /** \brief Frame start times, non-decreasing. */
    event_table<DataTypes> frames;

    /** \brief Validated laser pulse train (FLIM mode with a Laser channel). */
    std::optional<event_table<DataTypes>> laser;

    /** \brief Derived scalar timing parameters. */
    timing_constants<DataTypes> timing;

    /** \brief Lines were synthesized because none were recorded. */
    bool lines_synthesized = false;

    /** \brief Recorded lines were corrupt and rebuilt from the frames. */
    bool lines_rebuilt = false;

    /** \brief A line at time zero was prepended to the recorded lines. */
    bool zero_line_prepended = false;

    /** \brief Frames were derived from the lines. */
    bool frames_synthesized = false;

    /** \brief Number of laser pulses discarded for bad timing. */
    std::size_t pulses_discarded = 0;
};

namespace internal {

inline void require_positive(std::size_t value, char const *what) {
    if (value == 0)
        throw configuration_error(std::string("no ") + what +
                                  " value received, or value was zero");
}

template <typename T> inline auto mean_spacing(std::vector<T> const &series) {
    return mean(successive_differences(series));
}

} // namespace internal

/**
 * \brief Determine whether a marker series is corrupt.
 *
 * \ingroup reconcile
 *
 * The change of each marker spacing relative to the spacing
 * `pscan::corruption_window` markers earlier is computed; the series is
 * corrupt if more than \p max_fraction of its markers have a change exceeding
 * \p threshold percent.
 */
template <typename T>
auto is_marker_series_corrupt(
    std::vector<T> const &series, arg::threshold<double> threshold,
    arg::fraction<double> max_fraction = arg::fraction{corruption_max_fraction})
    -> bool {
    return fraction_exceeding_pct_change(series, threshold,
                                         arg::periods{corruption_window}) >
           max_fraction.value;
}

/**
 * \brief Create uniformly spaced line start times.
 *
 * \ingroup reconcile
 *
 * Exactly `lines_per_frame * num_frames` lines are created, starting at 0 and
 * spaced by `last_event_time / (lines_per_frame * num_frames)` (each time
 * rounded down to a whole bin).
 *
 * \throws configuration_error if any parameter is zero
 */
template <typename DataTypes = default_data_types>
auto create_line_array(
    arg::last_event_time<typename DataTypes::abstime_type> last_event_time,
    arg::lines_per_frame<std::size_t> lines_per_frame,
    arg::num_frames<std::size_t> num_frames)
    -> std::vector<typename DataTypes::abstime_type> {
    using abstime_type = typename DataTypes::abstime_type;
    if (lines_per_frame.value == 0 || num_frames.value == 0)
        throw configuration_error(
            "number of lines and frames has to be positive");
    if (last_event_time.value == 0)
        throw configuration_error("last event time is zero");

    auto const total = lines_per_frame.value * num_frames.value;
    auto const step = static_cast<double>(last_event_time.value) /
                      static_cast<double>(total);
    std::vector<abstime_type> ret;
    ret.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        ret.push_back(static_cast<abstime_type>(
            std::floor(static_cast<double>(i) * step)));
    }
    return ret;
}

/**
 * \brief Derive frame start times from line start times.
 *
 * \ingroup reconcile
 *
 * In bidirectional mode every line marker starts a scan line; in
 * unidirectional mode only every other marker does (the others mark the
 * return of the scanner). Every `lines_per_frame`-th scan line then starts a
 * frame, discarding lines of a trailing incomplete frame. If fewer scan lines
 * than one frame were recorded, a single frame at time 0 is returned.
 */
template <typename DataTypes = default_data_types>
auto create_frame_array(
    std::vector<typename DataTypes::abstime_type> const &lines,
    arg::last_event_time<typename DataTypes::abstime_type> last_event_time,
    arg::lines_per_frame<std::size_t> lines_per_frame, bool bidir)
    -> std::vector<typename DataTypes::abstime_type> {
    using abstime_type = typename DataTypes::abstime_type;
    if (lines.empty())
        throw data_validation_error("cannot create frames without lines");
    if (last_event_time.value == 0)
        throw configuration_error("last event time is zero");
    internal::require_positive(lines_per_frame.value, "lines per frame");

    std::vector<abstime_type> scan_lines;
    if (bidir) {
        scan_lines = lines;
    } else {
        for (std::size_t i = 0; i < lines.size(); i += 2)
            scan_lines.push_back(lines[i]);
    }

    auto const n = scan_lines.size();
    if (n < lines_per_frame.value)
        return {abstime_type{0}};

    auto const usable = n - n % lines_per_frame.value;
    std::vector<abstime_type> ret;
    ret.reserve(usable / lines_per_frame.value);
    for (std::size_t i = 0; i < usable; i += lines_per_frame.value)
        ret.push_back(scan_lines[i]);
    return ret;
}

/**
 * \brief Rebuild line start times by dividing each frame into uniformly
 * spaced lines.
 *
 * \ingroup reconcile
 *
 * The last frame extends to \p last_event_time.
 *
 * \return the lines and the mean line spacing
 */
template <typename DataTypes = default_data_types>
auto rebuild_lines_from_frames(
    std::vector<typename DataTypes::abstime_type> const &frames,
    arg::last_event_time<typename DataTypes::abstime_type> last_event_time,
    arg::lines_per_frame<std::size_t> lines_per_frame)
    -> std::pair<std::vector<typename DataTypes::abstime_type>, double> {
    using abstime_type = typename DataTypes::abstime_type;
    internal::require_positive(lines_per_frame.value, "lines per frame");
    auto const starts = unique_sorted(frames);
    if (starts.empty())
        throw data_validation_error("cannot rebuild lines without frames");

    std::vector<abstime_type> lines;
    lines.reserve(starts.size() * lines_per_frame.value);
    for (std::size_t f = 0; f < starts.size(); ++f) {
        auto const start = starts[f];
        auto const end =
            f + 1 < starts.size() ? starts[f + 1] : last_event_time.value;
        if (end <= start)
            throw data_validation_error(
                "frame markers do not span any time; cannot rebuild lines");
        auto const step = static_cast<double>(end - start) /
                          static_cast<double>(lines_per_frame.value);
        for (std::size_t i = 0; i < lines_per_frame.value; ++i) {
            lines.push_back(
                start + static_cast<abstime_type>(
                            std::floor(static_cast<double>(i) * step)));
        }
    }
    auto const span =
        static_cast<double>(last_event_time.value - starts.front());
    auto const line_delta =
        span / static_cast<double>(starts.size() * lines_per_frame.value);
    return {std::move(lines), line_delta};
}

/**
 * \brief Check that synthesized lines are evenly spaced within each frame.
 *
 * \ingroup reconcile
 *
 * Within each frame, every line spacing must be within \p jitter (relative)
 * of the frame's mean spacing, or within 1 bin of it (rounding to whole
 * bins).
 *
 * \throws data_validation_error on violation
 */
template <typename T>
void check_line_spacing(std::vector<T> const &lines,
                        arg::lines_per_frame<std::size_t> lines_per_frame,
                        arg::fraction<double> jitter) {
    internal::require_positive(lines_per_frame.value, "lines per frame");
    for (std::size_t first = 0; first < lines.size();
         first += lines_per_frame.value) {
        auto const last =
            std::min(first + lines_per_frame.value, lines.size());
        std::vector<T> const frame_lines(
            lines.begin() + static_cast<long>(first),
            lines.begin() + static_cast<long>(last));
        auto const spacings = successive_differences(frame_lines);
        if (spacings.empty())
            continue;
        auto const m = mean(spacings);
        auto const tolerance = std::max(jitter.value * m, 1.0);
        for (auto const s : spacings) {
            if (std::abs(s - m) > tolerance)
                throw data_validation_error(
                    "synthesized lines are not evenly spaced within the "
                    "jitter tolerance");
        }
    }
}

/**
 * \brief Compute the time spanned by the whole experiment.
 *
 * \ingroup reconcile
 *
 * In order of priority:
 * - If frames were recorded: the last frame time plus the mean frame spacing
 *   (or twice the frame time if only one frame was recorded).
 * - If at least 2 lines were recorded: extrapolated from the lines. When
 *   \p num_frames is known and more lines than `lines_per_frame * num_frames`
 *   were recorded, the last line of the last complete frame plus the span of
 *   that frame. When the lines fill whole frames, the last line plus the mean
 *   line spacing. Otherwise the last line plus enough spacings to complete
 *   the last frame, plus one.
 * - Otherwise: the latest photon time over all detector channels.
 *
 * \throws configuration_error if \p lines_per_frame is zero
 *
 * \throws data_validation_error if there are no detector channels or no
 * photons to fall back on
 */
template <typename DataTypes = default_data_types>
auto calc_last_event_time(channel_data<DataTypes> const &channels,
                          arg::lines_per_frame<std::size_t> lines_per_frame,
                          std::optional<std::size_t> num_frames = std::nullopt)
    -> typename DataTypes::abstime_type {
    using abstime_type = typename DataTypes::abstime_type;
    if (lines_per_frame.value < 1)
        throw configuration_error(
            "no lines per frame value received, or value was corrupt");
    if (channels.pmt_numbers().empty())
        throw data_validation_error("no PMT channel in data");

    if (channels.has_events(frames_channel)) {
        auto const &frames = channels.at(frames_channel).abstime;
        auto const last_frame = frames.back();
        if (frames.size() == 1)
            return 2 * last_frame;
        auto const frame_diff =
            static_cast<abstime_type>(internal::mean_spacing(frames));
        return last_frame + frame_diff;
    }

    if (channels.has_events(lines_channel) &&
        channels.at(lines_channel).size() >= 2) {
        auto const &lines = channels.at(lines_channel).abstime;
        auto const lpf = lines_per_frame.value;
        auto const n = lines.size();
        auto const line_diff =
            static_cast<abstime_type>(internal::mean_spacing(lines));

        if (num_frames && *num_frames >= 1 && n > lpf * *num_frames) {
            auto const complete = lpf * *num_frames;
            auto const last_line_of_last_frame = lines[complete - 1];
            auto const frame_span =
                last_line_of_last_frame - lines[complete - lpf];
            return last_line_of_last_frame + frame_span;
        }
        auto const remainder = n % lpf;
        if (remainder == 0)
            return lines.back() + line_diff;
        auto const missing_lines = lpf - remainder;
        return lines.back() +
               static_cast<abstime_type>(missing_lines + 1) * line_diff;
    }

    auto const max_pmt = channels.max_pmt_abstime();
    if (not max_pmt)
        throw data_validation_error(
            "no photons recorded; cannot determine last event time");
    return *max_pmt;
}

/**
 * \brief Keep only laser pulses whose spacing matches the repetition rate.
 *
 * \ingroup reconcile
 *
 * A pulse is kept if its distance to the preceding recorded pulse is within 1
 * bin of `1 / (reprate * binwidth)`. The first pulse is always kept. If more
 * than 10% of the pulses are discarded, a `pscan::warning_event` is emitted.
 * If \p reprate is zero or not finite, 80.3 MHz is assumed and a warning is
 * emitted.
 *
 * \return the kept pulses and the number discarded
 */
template <typename DataTypes = default_data_types, typename WarningSink>
auto validate_laser_input(event_table<DataTypes> const &pulses,
                          arg::rep_rate<double> reprate,
                          arg::bin_width<double> binwidth,
                          WarningSink &&warnings)
    -> std::pair<event_table<DataTypes>, std::size_t> {
    if (not(binwidth.value > 0.0))
        throw configuration_error("binwidth must be positive");
    auto rate = reprate.value;
    if (not std::isfinite(rate) || rate <= 0.0) {
        warnings.handle(warning_event{
            "no laser reprate provided; assuming 80.3 MHz"});
        rate = default_reprate;
    }

    event_table<DataTypes> kept;
    if (pulses.empty())
        return {kept, 0};

    auto const period = 1.0 / (rate * binwidth.value);
    auto const &t = pulses.abstime;
    kept.abstime.reserve(t.size());
    kept.abstime.push_back(t.front());
    for (std::size_t i = 1; i < t.size(); ++i) {
        auto const diff =
            static_cast<double>(t[i]) - static_cast<double>(t[i - 1]);
        if (std::abs(diff - period) <= 1.0)
            kept.abstime.push_back(t[i]);
    }

    auto const discarded = t.size() - kept.size();
    if (static_cast<double>(discarded) >
        max_discarded_pulse_fraction * static_cast<double>(t.size())) {
        warnings.handle(warning_event{
            "more than 10% of laser pulses were filtered due to bad timings; "
            "make sure the laser input is fine"});
    }
    return {std::move(kept), discarded};
}

/**
 * \brief Compute the number of bins between laser pulses.
 *
 * \ingroup reconcile
 *
 * \return `ceil(1 / (reprate * binwidth))`, using 80.3 MHz when \p reprate is
 * zero or not finite (with a warning)
 */
template <typename WarningSink>
auto bins_between_pulses(arg::rep_rate<double> reprate,
                         arg::bin_width<double> binwidth,
                         WarningSink &&warnings) -> u64 {
    if (not(binwidth.value > 0.0))
        throw configuration_error("binwidth must be positive");
    auto rate = reprate.value;
    if (not std::isfinite(rate) || rate <= 0.0) {
        warnings.handle(warning_event{
            "no laser reprate provided; assuming 80.3 MHz"});
        rate = default_reprate;
    }
    return static_cast<u64>(std::ceil(1.0 / (rate * binwidth.value)));
}

namespace internal {

template <typename DataTypes> struct line_reconciliation {
    std::vector<typename DataTypes::abstime_type> lines;
    double line_delta = 0.0;
    bool synthesized = false;
    bool rebuilt = false;
    bool zero_prepended = false;
};

template <typename DataTypes, typename WarningSink>
auto reconcile_lines(channel_data<DataTypes> const &channels,
                     typename DataTypes::abstime_type last_event_time,
                     std::size_t lines_per_frame, std::size_t num_frames,
                     double jitter, WarningSink &warnings)
    -> line_reconciliation<DataTypes> {
    using abstime_type = typename DataTypes::abstime_type;
    line_reconciliation<DataTypes> ret;

    auto const synthesize = [&] {
        ret.lines = create_line_array<DataTypes>(
            arg::last_event_time{last_event_time},
            arg::lines_per_frame{lines_per_frame},
            arg::num_frames{num_frames});
        check_line_spacing(ret.lines, arg::lines_per_frame{lines_per_frame},
                           arg::fraction{jitter});
        ret.line_delta = static_cast<double>(last_event_time) /
                         static_cast<double>(lines_per_frame * num_frames);
        ret.synthesized = true;
    };

    if (not channels.has_events(lines_channel)) {
        synthesize();
        return ret;
    }

    auto const &recorded = channels.at(lines_channel).abstime;
    if (recorded.size() < 2) {
        warnings.handle(warning_event{
            "a single line marker cannot define line spacing; lines were "
            "synthesized"});
        synthesize();
        return ret;
    }

    bool const corrupt = is_marker_series_corrupt(
        recorded, arg::threshold{line_corruption_threshold_pct});
    if (corrupt) {
        if (not channels.has_events(frames_channel)) {
            throw data_corruption_error(
                "line data was corrupt and there is no frame channel to "
                "rebuild it from; rerun without a line channel");
        }
        auto [lines, delta] = rebuild_lines_from_frames<DataTypes>(
            channels.at(frames_channel).abstime,
            arg::last_event_time{last_event_time},
            arg::lines_per_frame{lines_per_frame});
        check_line_spacing(lines, arg::lines_per_frame{lines_per_frame},
                           arg::fraction{jitter});
        ret.lines = std::move(lines);
        ret.line_delta = delta;
        ret.rebuilt = true;
        return ret;
    }

    ret.line_delta = mean_spacing(recorded);
    ret.lines = recorded;
    auto const zeroth_line_delta =
        std::abs(static_cast<double>(recorded.front()) - ret.line_delta) /
        ret.line_delta;
    if (zeroth_line_delta < zeroth_line_tolerance) {
        ret.lines.insert(ret.lines.begin(), abstime_type{0});
        ret.zero_prepended = true;
    }
    return ret;
}

} // namespace internal

/**
 * \brief Reconcile the line, frame and laser marker series of an
 * acquisition.
 *
 * \ingroup reconcile
 *
 * Lines:
 * - not recorded: synthesized uniformly from the last event time and the
 *   expected line and frame counts;
 * - recorded and corrupt: rebuilt from the frames, or
 *   `pscan::data_corruption_error` if there are no frames;
 * - recorded and valid: kept, with a line at time zero prepended if the first
 *   line is within 5% of one line spacing from zero.
 *
 * Frames are kept if recorded (a warning is issued if their spacing is
 * irregular) and otherwise derived from the lines.
 *
 * In FLIM mode, the laser pulse train is validated; without a Laser channel a
 * warning is emitted and the pulse axis is disabled.
 *
 * \param channels the per-channel event tables
 *
 * \param config the validated configuration (`lines_per_frame` and
 * `num_of_frames` are required)
 *
 * \param warnings warning sink
 *
 * \throws configuration_error if a required scalar is missing
 *
 * \throws data_validation_error if a series is not monotonic or cannot be
 * reconciled
 */
template <typename DataTypes = default_data_types, typename WarningSink>
auto reconcile_markers(channel_data<DataTypes> const &channels,
                       movie_config const &config, WarningSink &&warnings)
    -> reconciled_markers<DataTypes> {
    auto const lpf = config.lines_per_frame();
    internal::require_positive(lpf, "number of lines");
    if (not config.num_of_frames())
        throw configuration_error("no number of frames received");
    auto const num_frames = *config.num_of_frames();
    internal::require_positive(num_frames, "number of frames");

    for (auto const id : {lines_channel, frames_channel, laser_channel,
                          tag_lens_channel, phase_channel}) {
        if (auto const *table = channels.find(id))
            check_monotonic(table->abstime, channel_name(id));
    }

    reconciled_markers<DataTypes> ret;
    ret.timing.binwidth = config.binwidth();
    ret.timing.reprate = config.reprate();
    ret.timing.last_event_time = calc_last_event_time(
        channels, arg::lines_per_frame{lpf}, config.num_of_frames());
    if (ret.timing.last_event_time == 0)
        throw configuration_error("last event time is zero");

    auto lines = internal::reconcile_lines(
        channels, ret.timing.last_event_time, lpf, num_frames,
        config.jitter(), warnings);
    ret.lines.abstime = std::move(lines.lines);
    ret.timing.line_delta = lines.line_delta;
    ret.lines_synthesized = lines.synthesized;
    ret.lines_rebuilt = lines.rebuilt;
    ret.zero_line_prepended = lines.zero_prepended;

    if (channels.has_events(frames_channel)) {
        ret.frames = channels.at(frames_channel);
        if (is_marker_series_corrupt(
                ret.frames.abstime,
                arg::threshold{frame_corruption_threshold_pct})) {
            warnings.handle(warning_event{
                "frame marker spacing is irregular; volumes may differ in "
                "duration"});
        }
    } else {
        ret.frames.abstime = create_frame_array<DataTypes>(
            ret.lines.abstime, arg::last_event_time{ret.timing.last_event_time},
            arg::lines_per_frame{lpf}, config.bidir());
        ret.frames_synthesized = true;
    }

    if (config.flim()) {
        ret.timing.bins_between_pulses =
            bins_between_pulses(arg::rep_rate{config.reprate()},
                                arg::bin_width{config.binwidth()}, warnings);
        if (not(config.reprate() > 0.0))
            ret.timing.reprate = default_reprate;
        if (channels.has_events(laser_channel)) {
            auto [pulses, discarded] = validate_laser_input(
                channels.at(laser_channel),
                arg::rep_rate{ret.timing.reprate},
                arg::bin_width{config.binwidth()}, warnings);
            ret.laser = std::move(pulses);
            ret.pulses_discarded = discarded;
        } else {
            warnings.handle(warning_event{
                "FLIM requested but there is no Laser channel; pulse "
                "arrival time will not be histogrammed"});
        }
    }

    check_monotonic(ret.lines.abstime, "reconciled Lines");
    check_monotonic(ret.frames.abstime, "reconciled Frames");
    return ret;
}

/**
 * \brief Warn about implausible relative channel counts.
 *
 * \ingroup reconcile
 *
 * Emits a `pscan::warning_event` if there are more frames than lines, fewer
 * TAG lens pulses than lines, fewer laser pulses than lines or frames, or
 * fewer laser pulses than TAG lens pulses. Never throws.
 */
template <typename DataTypes = default_data_types, typename WarningSink>
void check_channel_counts(channel_data<DataTypes> const &channels,
                          reconciled_markers<DataTypes> const &markers,
                          WarningSink &&warnings) {
    auto const n_lines = markers.lines.size();
    auto const n_frames = markers.frames.size();
    if (n_frames > n_lines) {
        warnings.handle(warning_event{
            "more frames than lines; consider swapping the two channels"});
    }
    auto const *tag = channels.find(tag_lens_channel);
    if (tag != nullptr && tag->size() < n_lines) {
        warnings.handle(warning_event{
            "more lines than TAG lens pulses; consider swapping the two "
            "channels"});
    }
    auto const *laser = channels.find(laser_channel);
    if (laser != nullptr) {
        if (laser->size() < n_lines || laser->size() < n_frames) {
            warnings.handle(warning_event{
                "laser pulse channel contained fewer ticks than the Lines or "
                "Frames channel"});
        }
        if (tag != nullptr && laser->size() < tag->size()) {
            warnings.handle(warning_event{
                "laser pulse channel contained fewer ticks than the TAG lens "
                "channel"});
        }
    }
}

} // namespace pscan
