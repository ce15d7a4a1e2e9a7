/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "arg_wrappers.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pscan {

// Design note: statistics over timestamp series are computed in double. The
// timestamps are bin counts that may reach ~1e13 over a long acquisition, but
// the quantities computed here (differences and ratios of differences) are
// small enough that double precision is exact or nearly so.

/**
 * \brief Compute successive differences of a timestamp series.
 *
 * \ingroup series-stats
 *
 * \return vector of size `values.size() - 1` (empty if fewer than 2 values)
 * where element `i` is `values[i + 1] - values[i]`
 */
template <typename T>
auto successive_differences(std::vector<T> const &values)
    -> std::vector<double> {
    std::vector<double> ret;
    if (values.size() < 2)
        return ret;
    ret.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        // Subtract in double so that decreasing series do not wrap around.
        ret.push_back(static_cast<double>(values[i]) -
                      static_cast<double>(values[i - 1]));
    }
    return ret;
}

/**
 * \brief Arithmetic mean; NaN for an empty input.
 *
 * \ingroup series-stats
 */
inline auto mean(std::vector<double> const &values) -> double {
    if (values.empty())
        return std::numeric_limits<double>::quiet_NaN();
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

/**
 * \brief Median, averaging the two middle elements for even sizes; NaN for an
 * empty input.
 *
 * \ingroup series-stats
 */
inline auto median(std::vector<double> values) -> double {
    if (values.empty())
        return std::numeric_limits<double>::quiet_NaN();
    auto const n = values.size();
    auto const upper = std::next(values.begin(), static_cast<long>(n / 2));
    std::nth_element(values.begin(), upper, values.end());
    if (n % 2 == 1)
        return *upper;
    auto const lower = *std::max_element(values.begin(), upper);
    return 0.5 * (lower + *upper);
}

/**
 * \brief Fractional change of each element relative to the element \p periods
 * positions earlier.
 *
 * \ingroup series-stats
 *
 * The first `periods` elements of the result are NaN. A zero reference value
 * yields an infinite (or, for 0/0, NaN) change.
 */
inline auto pct_change(std::vector<double> const &values,
                       arg::periods<> periods) -> std::vector<double> {
    if (periods.value == 0)
        throw std::invalid_argument("pct_change periods must be positive");
    std::vector<double> ret(values.size(),
                            std::numeric_limits<double>::quiet_NaN());
    for (std::size_t i = periods.value; i < values.size(); ++i)
        ret[i] = values[i] / values[i - periods.value] - 1.0;
    return ret;
}

/**
 * \brief Fraction of a marker series whose spacing changed by more than a
 * threshold relative to the spacing \p periods markers earlier.
 *
 * \ingroup series-stats
 *
 * The count of spacings whose absolute percent change exceeds \p threshold
 * (given in percent) is divided by the number of markers in the series. NaN
 * changes (not enough history, or 0/0) are not counted.
 *
 * \return fraction in [0, 1]; 0 for an empty series
 */
template <typename T>
auto fraction_exceeding_pct_change(std::vector<T> const &series,
                                   arg::threshold<double> threshold,
                                   arg::periods<> periods) -> double {
    if (series.empty())
        return 0.0;
    auto const changes = pct_change(successive_differences(series), periods);
    auto const n_exceeding = std::count_if(
        changes.begin(), changes.end(), [&](double change) {
            return not std::isnan(change) &&
                   std::abs(change) * 100.0 > threshold.value;
        });
    return static_cast<double>(n_exceeding) /
           static_cast<double>(series.size());
}

/**
 * \brief Throw `pscan::data_validation_error` if a series decreases anywhere.
 *
 * \ingroup series-stats
 *
 * \param series the series to check
 *
 * \param what name of the series, used in the error message
 */
template <typename T>
void check_monotonic(std::vector<T> const &series, std::string const &what) {
    auto const it = std::is_sorted_until(series.begin(), series.end());
    if (it != series.end()) {
        std::ostringstream stream;
        stream << what << " timestamps are not monotonic (index "
               << std::distance(series.begin(), it) << ")";
        throw data_validation_error(stream.str());
    }
}

/**
 * \brief Return the sorted distinct values of a series.
 *
 * \ingroup series-stats
 */
template <typename T> auto unique_sorted(std::vector<T> values) -> std::vector<T> {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

} // namespace pscan
