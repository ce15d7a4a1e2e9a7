/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "data_types.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief The kinds of logical channel produced by the list-file parser.
 *
 * \ingroup channels
 */
enum class channel_kind {
    /** \brief Photon detector (PMT1, PMT2, ...). */
    pmt,
    /** \brief Start-of-line markers. */
    lines,
    /** \brief Start-of-frame (volume) markers. */
    frames,
    /** \brief Laser pulse markers, for time-correlated (FLIM) data. */
    laser,
    /** \brief TAG lens period markers, giving the depth phase. */
    tag_lens,
    /** \brief Generic phase markers (multi-beam setups). */
    phase,
};

/**
 * \brief Identifies one logical channel.
 *
 * \ingroup channels
 *
 * Only detector channels carry a number (starting at 1); for marker channels
 * the number is 0.
 */
struct channel_id {
    /** \brief The kind of channel. */
    channel_kind kind;

    /** \brief Detector number; 0 for marker channels. */
    u32 number = 0;

    /** \brief Equality comparison operator. */
    friend auto operator==(channel_id const &lhs,
                           channel_id const &rhs) noexcept -> bool {
        return lhs.kind == rhs.kind && lhs.number == rhs.number;
    }

    /** \brief Inequality comparison operator. */
    friend auto operator!=(channel_id const &lhs,
                           channel_id const &rhs) noexcept -> bool {
        return not(lhs == rhs);
    }

    /** \brief Ordering (by kind, then number), for use as a map key. */
    friend auto operator<(channel_id const &lhs,
                          channel_id const &rhs) noexcept -> bool {
        return std::tie(lhs.kind, lhs.number) <
               std::tie(rhs.kind, rhs.number);
    }
};

/** \brief Make the identifier of detector channel \p number. */
inline auto pmt_channel(u32 number) -> channel_id {
    if (number == 0)
        throw std::invalid_argument("PMT channel numbers start at 1");
    return {channel_kind::pmt, number};
}

/** \brief The line marker channel. */
inline constexpr channel_id lines_channel{channel_kind::lines, 0};

/** \brief The frame marker channel. */
inline constexpr channel_id frames_channel{channel_kind::frames, 0};

/** \brief The laser pulse channel. */
inline constexpr channel_id laser_channel{channel_kind::laser, 0};

/** \brief The TAG lens channel. */
inline constexpr channel_id tag_lens_channel{channel_kind::tag_lens, 0};

/** \brief The phase marker channel. */
inline constexpr channel_id phase_channel{channel_kind::phase, 0};

/**
 * \brief Map a channel name as used by the list-file parser to a channel
 * identifier.
 *
 * \ingroup channels
 *
 * Recognized names are `PMT1`, `PMT2`, ..., `Lines`, `Frames`, `Laser`,
 * `TAG Lens` and `Phase`.
 *
 * \return the identifier, or `std::nullopt` if the name is not recognized
 */
inline auto parse_channel_name(std::string const &name)
    -> std::optional<channel_id> {
    if (name == "Lines")
        return lines_channel;
    if (name == "Frames")
        return frames_channel;
    if (name == "Laser")
        return laser_channel;
    if (name == "TAG Lens")
        return tag_lens_channel;
    if (name == "Phase")
        return phase_channel;

    static std::string const prefix = "PMT";
    if (name.size() <= prefix.size() || name.compare(0, 3, prefix) != 0)
        return std::nullopt;
    auto const digits = name.substr(prefix.size());
    if (digits.size() > 9 || digits.front() == '0' ||
        not std::all_of(digits.begin(), digits.end(),
                        [](char c) { return c >= '0' && c <= '9'; }))
        return std::nullopt;
    return channel_id{channel_kind::pmt,
                      static_cast<u32>(std::stoul(digits))};
}

/**
 * \brief Return the parser name of a channel.
 *
 * \ingroup channels
 */
inline auto channel_name(channel_id id) -> std::string {
    switch (id.kind) {
    case channel_kind::pmt:
        return "PMT" + std::to_string(id.number);
    case channel_kind::lines:
        return "Lines";
    case channel_kind::frames:
        return "Frames";
    case channel_kind::laser:
        return "Laser";
    case channel_kind::tag_lens:
        return "TAG Lens";
    case channel_kind::phase:
        return "Phase";
    }
    throw std::invalid_argument("invalid channel kind");
}

/** \brief Stream insertion operator. */
inline auto operator<<(std::ostream &stream, channel_id const &id)
    -> std::ostream & {
    return stream << channel_name(id);
}

/**
 * \brief Time-ordered events of one logical channel.
 *
 * \ingroup channels
 *
 * Each event is an absolute timestamp in multiscaler bins. Tables are treated
 * as immutable once produced by the parser; reconciliation produces new
 * tables.
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> struct event_table {
    /** \brief Absolute event times, non-decreasing. */
    std::vector<typename DataTypes::abstime_type> abstime;

    /** \brief Return the number of events. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return abstime.size();
    }

    /** \brief Return true if the table holds no events. */
    [[nodiscard]] auto empty() const noexcept -> bool {
        return abstime.empty();
    }

    /** \brief Equality comparison operator. */
    friend auto operator==(event_table const &lhs,
                           event_table const &rhs) noexcept -> bool {
        return lhs.abstime == rhs.abstime;
    }

    /** \brief Inequality comparison operator. */
    friend auto operator!=(event_table const &lhs,
                           event_table const &rhs) noexcept -> bool {
        return not(lhs == rhs);
    }
};

/**
 * \brief What to do with a channel name that is not recognized.
 *
 * \ingroup channels
 */
enum class unknown_channel_policy {
    /** \brief Throw `std::invalid_argument`. */
    reject,
    /** \brief Skip the table. */
    ignore,
};

/**
 * \brief The per-channel event tables of one acquisition.
 *
 * \ingroup channels
 *
 * \tparam DataTypes data type set specifying `abstime_type`
 */
template <typename DataTypes = default_data_types> class channel_data {
    using abstime_type = typename DataTypes::abstime_type;

    std::map<channel_id, event_table<DataTypes>> tables;

  public:
    /**
     * \brief Build from tables keyed by parser channel name.
     *
     * \param named map from channel name to timestamps
     *
     * \param policy what to do with unrecognized names
     */
    static auto from_named_tables(
        std::map<std::string, std::vector<abstime_type>> named,
        unknown_channel_policy policy = unknown_channel_policy::reject)
        -> channel_data {
        channel_data ret;
        for (auto &[name, times] : named) {
            auto const id = parse_channel_name(name);
            if (not id) {
                if (policy == unknown_channel_policy::ignore)
                    continue;
                throw std::invalid_argument("unknown channel name: " + name);
            }
            ret.insert(*id, event_table<DataTypes>{std::move(times)});
        }
        return ret;
    }

    /** \brief Add or replace the table of a channel. */
    void insert(channel_id id, event_table<DataTypes> table) {
        tables.insert_or_assign(id, std::move(table));
    }

    /**
     * \brief Add or replace the table of a channel given by parser name.
     *
     * \throws std::invalid_argument if the name is not recognized
     */
    void insert(std::string const &name, event_table<DataTypes> table) {
        auto const id = parse_channel_name(name);
        if (not id)
            throw std::invalid_argument("unknown channel name: " + name);
        insert(*id, std::move(table));
    }

    /** \brief Remove the table of a channel, if present. */
    void erase(channel_id id) { tables.erase(id); }

    /** \brief Return true if a table (possibly empty) exists for \p id. */
    [[nodiscard]] auto contains(channel_id id) const -> bool {
        return tables.count(id) != 0;
    }

    /** \brief Return true if a non-empty table exists for \p id. */
    [[nodiscard]] auto has_events(channel_id id) const -> bool {
        auto const it = tables.find(id);
        return it != tables.end() && not it->second.empty();
    }

    /**
     * \brief Return the table of a channel.
     *
     * \throws std::out_of_range if there is no table for \p id
     */
    [[nodiscard]] auto at(channel_id id) const
        -> event_table<DataTypes> const & {
        auto const it = tables.find(id);
        if (it == tables.end())
            throw std::out_of_range("no data for channel " +
                                    channel_name(id));
        return it->second;
    }

    /** \brief Return the table of a channel, or null if absent. */
    [[nodiscard]] auto find(channel_id id) const
        -> event_table<DataTypes> const * {
        auto const it = tables.find(id);
        return it == tables.end() ? nullptr : &it->second;
    }

    /** \brief Return the numbers of the detector channels present, sorted. */
    [[nodiscard]] auto pmt_numbers() const -> std::vector<u32> {
        std::vector<u32> ret;
        for (auto const &entry : tables) {
            if (entry.first.kind == channel_kind::pmt)
                ret.push_back(entry.first.number);
        }
        return ret;
    }

    /**
     * \brief Return the latest timestamp over all detector channels, or
     * `std::nullopt` if no detector recorded any event.
     */
    [[nodiscard]] auto max_pmt_abstime() const
        -> std::optional<abstime_type> {
        std::optional<abstime_type> ret;
        for (auto const &[id, table] : tables) {
            if (id.kind != channel_kind::pmt || table.empty())
                continue;
            auto const m = *std::max_element(table.abstime.begin(),
                                             table.abstime.end());
            if (not ret || m > *ret)
                ret = m;
        }
        return ret;
    }

    /** \brief Return the number of channels with a table. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return tables.size();
    }
};

} // namespace pscan
