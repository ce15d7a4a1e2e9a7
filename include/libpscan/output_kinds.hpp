/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <type_traits>

namespace pscan {

/**
 * \brief Bit flags selecting the outputs produced by the movie assembler.
 *
 * \ingroup movie-outputs
 *
 * Values can be combined with the `|` operator.
 */
enum class output_kind {
    /** \brief No output; the assembler warns and does nothing. */
    none = 0,

    /**
     * \brief Keep the running sum and the ordered stack of volume histograms
     * of each channel in memory.
     */
    memory = 1 << 0,

    /**
     * \brief Write each volume histogram to the volume store as it is
     * produced (group `"Full Stack"`).
     */
    stack = 1 << 1,

    /**
     * \brief Write only the final running sum of each channel to the volume
     * store (group `"Summed Stack"`).
     */
    summed = 1 << 2,
};

/** \private */
inline constexpr auto operator|(output_kind lhs, output_kind rhs) noexcept
    -> output_kind {
    using U = std::underlying_type_t<output_kind>;
    return static_cast<output_kind>(static_cast<U>(lhs) |
                                    static_cast<U>(rhs));
}

/** \private */
inline constexpr auto operator&(output_kind lhs, output_kind rhs) noexcept
    -> output_kind {
    using U = std::underlying_type_t<output_kind>;
    return static_cast<output_kind>(static_cast<U>(lhs) &
                                    static_cast<U>(rhs));
}

/** \private */
inline constexpr auto operator|=(output_kind &lhs, output_kind rhs) noexcept
    -> output_kind & {
    return lhs = lhs | rhs;
}

/**
 * \brief Return true if \p kinds includes every flag in \p flag.
 *
 * \ingroup movie-outputs
 */
inline constexpr auto includes(output_kind kinds, output_kind flag) noexcept
    -> bool {
    return flag != output_kind::none && (kinds & flag) == flag;
}

} // namespace pscan
