/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <cstddef>

/**
 * \namespace pscan::arg
 * \brief Argument wrappers
 * \ingroup arg-wrappers
 */
namespace pscan::arg {

// Function argument wrappers for strong typing (avoiding mistakes with
// otherwise easily swappable parameters, such as the three pixel counts). Each
// has a constructor so that default construction cannot leave the value
// uninitialized and so that CTAD works.
// Ordered alphabetically.

/**
 * \brief Function argument wrapper for bin width parameter.
 */
template <typename T> struct bin_width {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit bin_width(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for fill fraction parameter.
 */
template <typename T> struct fill_fraction {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit fill_fraction(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for fraction parameter.
 */
template <typename T> struct fraction {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit fraction(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for last event time parameter.
 */
template <typename T> struct last_event_time {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit last_event_time(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for lines per frame parameter.
 */
template <typename T> struct lines_per_frame {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit lines_per_frame(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for number of frames parameter.
 */
template <typename T> struct num_frames {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit num_frames(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for periods parameter.
 */
template <typename T = std::size_t> struct periods {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit periods(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for repetition rate parameter.
 */
template <typename T> struct rep_rate {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit rep_rate(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for threshold parameter.
 */
template <typename T> struct threshold {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit threshold(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for X pixel count parameter.
 */
template <typename T = std::size_t> struct x_pixels {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit x_pixels(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for Y pixel count parameter.
 */
template <typename T = std::size_t> struct y_pixels {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit y_pixels(T arg) : value(arg) {}
};

/**
 * \brief Function argument wrapper for Z pixel count parameter.
 */
template <typename T = std::size_t> struct z_pixels {
    /** \brief The argument value. */
    T value;
    /** \brief Construct by wrapping a value. */
    explicit z_pixels(T arg) : value(arg) {}
};

} // namespace pscan::arg
