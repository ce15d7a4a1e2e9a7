/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

namespace pscan {

/**
 * \brief Policy for a volume histogram bin exceeding the range of the bin
 * type.
 *
 * \ingroup histogram-policies
 */
enum class overflow_policy {
    /**
     * \brief Treat a histogram bin overflow as an error.
     *
     * If an increment is about to cause a bin overflow, throw
     * `pscan::histogram_overflow_error`. The run is aborted.
     */
    error_on_overflow,

    /**
     * \brief Ignore increments that would cause a bin overflow.
     *
     * On the first overflow within a volume, emit a `pscan::warning_event`.
     */
    saturate_on_overflow,
};

/**
 * \brief Policy for the censor (detector dead-time) correction pass.
 *
 * \ingroup histogram-policies
 *
 * The reference behavior locates pixels that received more than one photon
 * (summed over the last histogram axis) but does not modify the histogram. A
 * correction that redistributes counts is not defined; requesting censor
 * correction therefore selects one of the explicit behaviors below.
 */
enum class censor_policy {
    /**
     * \brief Locate multi-photon pixels, report their number as a warning,
     * and leave the histogram unchanged.
     */
    reference_no_op,

    /**
     * \brief Refuse censor correction: requesting it is a configuration error.
     */
    reject,
};

} // namespace pscan
