/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <stdexcept>

namespace pscan {

/**
 * \brief Error thrown when a configuration scalar is missing or out of range.
 *
 * \ingroup errors
 *
 * Configuration errors are detected before any photon is histogrammed, either
 * when a `pscan::movie_config` is constructed or at the marker reconciliation
 * boundary.
 */
class configuration_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/**
 * \brief Error thrown when the data being processed does not meet
 * expectations.
 *
 * \ingroup errors
 */
class data_validation_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Error thrown when a marker series is corrupt and cannot be rebuilt
 * from another series.
 *
 * \ingroup errors
 */
class data_corruption_error : public data_validation_error {
  public:
    using data_validation_error::data_validation_error;
};

/**
 * \brief Error thrown when a volume does not contain enough line boundaries to
 * size its pixel axis.
 *
 * \ingroup errors
 */
class insufficient_data_error : public data_validation_error {
  public:
    using data_validation_error::data_validation_error;
};

/**
 * \brief Error thrown when a histogram bin overflows.
 *
 * \ingroup errors
 *
 * This error is thrown when the `pscan::overflow_policy::error_on_overflow`
 * policy was requested and a bin count exceeded the range of the bin type.
 */
class histogram_overflow_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace pscan
