/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "data_types.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace pscan {

/**
 * \brief One allocated photon, as read back from a `pscan::photon_table`.
 *
 * \ingroup photon-table
 *
 * \tparam DataTypes data type set specifying `abstime_type` and
 * `reltime_type`
 */
template <typename DataTypes = default_data_types> struct photon_row {
    /** \brief Detector channel number. */
    u32 channel;

    /** \brief Absolute photon time. */
    typename DataTypes::abstime_type abstime;

    /** \brief Start time of the containing frame. */
    typename DataTypes::abstime_type frame_start;

    /** \brief Start time of the containing line. */
    typename DataTypes::abstime_type line_start;

    /** \brief Photon time relative to the frame start. */
    typename DataTypes::reltime_type time_rel_frames;

    /** \brief Photon time relative to the line, after scan correction. */
    double time_rel_line;

    /** \brief Depth phase in [-1, 1]; 0 if the table has no phase. */
    double phase;

    /** \brief Photon time relative to the preceding laser pulse; 0 if the
     * table has no pulse times. */
    typename DataTypes::reltime_type time_rel_pulse;
};

/**
 * \brief Table of allocated photons, stored column-wise.
 *
 * \ingroup photon-table
 *
 * Rows are ordered by (channel, frame start, absolute time). The `phase` and
 * `time_rel_pulse` columns are filled only when `has_phase` and
 * `has_pulse_time` are set, respectively.
 *
 * \tparam DataTypes data type set specifying `abstime_type` and
 * `reltime_type`
 */
template <typename DataTypes = default_data_types> struct photon_table {
    /** \brief The absolute time type. */
    using abstime_type = typename DataTypes::abstime_type;

    /** \brief The relative time type. */
    using reltime_type = typename DataTypes::reltime_type;

    /** \brief Whether the `phase` column is present. */
    bool has_phase = false;

    /** \brief Whether the `time_rel_pulse` column is present. */
    bool has_pulse_time = false;

    /** \brief Detector channel numbers. */
    std::vector<u32> channel;

    /** \brief Absolute photon times. */
    std::vector<abstime_type> abstime;

    /** \brief Containing frame start times. */
    std::vector<abstime_type> frame_start;

    /** \brief Containing line start times. */
    std::vector<abstime_type> line_start;

    /** \brief Times relative to the frame start. */
    std::vector<reltime_type> time_rel_frames;

    /** \brief Times relative to the line start, after scan correction. */
    std::vector<double> time_rel_line;

    /** \brief Depth phase, if `has_phase`. */
    std::vector<double> phase;

    /** \brief Times relative to the preceding laser pulse, if
     * `has_pulse_time`. */
    std::vector<reltime_type> time_rel_pulse;

    /** \brief Return the number of rows. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return abstime.size();
    }

    /** \brief Return true if there are no rows. */
    [[nodiscard]] auto empty() const noexcept -> bool {
        return abstime.empty();
    }

    /**
     * \brief Append a row.
     *
     * The `phase` and `time_rel_pulse` fields are ignored for absent
     * columns.
     */
    void push_back(photon_row<DataTypes> const &row) {
        channel.push_back(row.channel);
        abstime.push_back(row.abstime);
        frame_start.push_back(row.frame_start);
        line_start.push_back(row.line_start);
        time_rel_frames.push_back(row.time_rel_frames);
        time_rel_line.push_back(row.time_rel_line);
        if (has_phase)
            phase.push_back(row.phase);
        if (has_pulse_time)
            time_rel_pulse.push_back(row.time_rel_pulse);
    }

    /**
     * \brief Return a copy of the row at \p index.
     *
     * \throws std::out_of_range if \p index is not less than `size()`
     */
    [[nodiscard]] auto row(std::size_t index) const -> photon_row<DataTypes> {
        if (index >= size())
            throw std::out_of_range("photon_table row index out of range");
        return {channel[index],
                abstime[index],
                frame_start[index],
                line_start[index],
                time_rel_frames[index],
                time_rel_line[index],
                has_phase ? phase[index] : 0.0,
                has_pulse_time ? time_rel_pulse[index] : reltime_type{0}};
    }

    /** \brief Reserve capacity in every present column. */
    void reserve(std::size_t capacity) {
        channel.reserve(capacity);
        abstime.reserve(capacity);
        frame_start.reserve(capacity);
        line_start.reserve(capacity);
        time_rel_frames.reserve(capacity);
        time_rel_line.reserve(capacity);
        if (has_phase)
            phase.reserve(capacity);
        if (has_pulse_time)
            time_rel_pulse.reserve(capacity);
    }
};

} // namespace pscan
