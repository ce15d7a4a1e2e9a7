/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <cstdint>

namespace pscan {

/**
 * \brief Short names for fixed-width integer types.
 *
 * \ingroup integers
 *
 * The types in this namespace are also available directly under the `pscan`
 * namespace.
 */
namespace int_types {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

} // namespace int_types

using namespace int_types;

/**
 * \brief The default data type set.
 *
 * This data type set is the default for the `DataTypes` template parameter of
 * the tables, events and functions that require one.
 *
 * Custom data type sets may (but need not) derive from this type and override
 * some or all of the member type aliases.
 *
 * \ingroup data-types
 */
struct default_data_types {
    /**
     * \brief Absolute time type, in multiscaler bins.
     *
     * Timestamps coming from the list-file parser are unsigned bin counts.
     */
    using abstime_type = u64;

    /**
     * \brief Signed time difference type, in bins.
     *
     * Used for times relative to a frame or a laser pulse.
     */
    using reltime_type = i64;

    /**
     * \brief Detector channel number type (PMT1 is channel 1).
     */
    using channel_type = u32;

    /**
     * \brief Type of per-volume histogram bin value (count).
     */
    using bin_type = i16;

    /**
     * \brief Type of running-sum bin value (count).
     */
    using summed_bin_type = i64;
};

} // namespace pscan
