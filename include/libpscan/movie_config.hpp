/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "histogram_policies.hpp"
#include "output_kinds.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace pscan {

/**
 * \brief Acquisition and reconstruction settings, as plain named scalars.
 *
 * \ingroup config
 *
 * This aggregate is filled in by the caller (typically from a GUI or a
 * configuration file that is parsed elsewhere) and then validated by
 * constructing a `pscan::movie_config`.
 */
struct movie_settings {
    /** \brief Multiscaler bin width, in seconds. */
    double binwidth = 800e-12;

    /** \brief Laser repetition rate, in Hz; 0 if unknown. */
    double reprate = 80e6;

    /** \brief Number of pixels along the line (slow, volume-time) axis. */
    std::size_t x_pixels = 512;

    /** \brief Number of pixels within each line. */
    std::size_t y_pixels = 512;

    /** \brief Number of depth (phase) planes. */
    std::size_t z_pixels = 1;

    /** \brief Lines per frame; 0 means equal to `x_pixels`. */
    std::size_t lines_per_frame = 0;

    /** \brief Expected number of frames in the acquisition. */
    std::optional<std::size_t> num_of_frames;

    /** \brief Whether the line scan is bidirectional. */
    bool bidir = true;

    /**
     * \brief In unidirectional mode, fold photons of the return (odd) lines
     * into the preceding line instead of discarding them.
     */
    bool keep_unidir = false;

    /** \brief Phase delay between forward and return lines, in radians. */
    double phase = 0.0;

    /** \brief Temporal fill fraction of the line scan, in percent. */
    double fill_frac = 80.0;

    /** \brief Number of detector channels (PMT1 to PMTn) to reconstruct. */
    std::size_t num_of_channels = 1;

    /** \brief Whether the acquisition used multiscaler sweeps. */
    bool use_sweeps = false;

    /** \brief Whether to run the censor correction pass. */
    bool censor = false;

    /** \brief Behavior of the censor correction pass. */
    censor_policy censoring = censor_policy::reference_no_op;

    /** \brief Whether to histogram photon arrival time relative to the
     * laser pulse (FLIM). */
    bool flim = false;

    /** \brief Behavior when a 16-bit histogram bin overflows. */
    overflow_policy overflow = overflow_policy::saturate_on_overflow;

    /** \brief Requested outputs. */
    output_kind outputs = output_kind::memory;

    /** \brief Relative timing tolerance of synthesized marker spacing. */
    double jitter = 0.02;
};

/**
 * \brief Validated, immutable reconstruction configuration.
 *
 * \ingroup config
 *
 * Construction checks every field of the given `pscan::movie_settings` and
 * throws `pscan::configuration_error` naming the first offending field.
 */
class movie_config {
    movie_settings s;

    [[noreturn]] LIBPSCAN_NOINLINE static void bad(std::string const &field,
                                 std::string const &requirement) {
        throw configuration_error("invalid configuration: " + field + " " +
                                  requirement);
    }

  public:
    /** \brief Construct from settings, validating them. */
    explicit movie_config(movie_settings settings) : s(std::move(settings)) {
        if (not std::isfinite(s.binwidth) || s.binwidth <= 0.0)
            bad("binwidth", "must be positive");
        if (not std::isfinite(s.reprate) || s.reprate < 0.0)
            bad("reprate", "must not be negative");
        if (s.x_pixels < 1)
            bad("x_pixels", "must be at least 1");
        if (s.y_pixels < 1)
            bad("y_pixels", "must be at least 1");
        if (s.z_pixels < 1)
            bad("z_pixels", "must be at least 1");
        if (s.lines_per_frame == 0)
            s.lines_per_frame = s.x_pixels;
        if (s.num_of_frames && *s.num_of_frames < 1)
            bad("num_of_frames", "must be at least 1");
        if (not std::isfinite(s.phase))
            bad("phase", "must be finite");
        if (not(s.fill_frac >= 0.0 && s.fill_frac <= 100.0))
            bad("fill_frac", "must be between 0 and 100");
        if (s.num_of_channels < 1)
            bad("num_of_channels", "must be at least 1");
        if (s.censor && s.censoring == censor_policy::reject)
            bad("censor", "is not supported under censor_policy::reject");
        if (not(s.jitter >= 0.0 && s.jitter < 1.0))
            bad("jitter", "must be in [0, 1)");
    }

    /** \brief Return the validated settings. */
    [[nodiscard]] auto settings() const noexcept -> movie_settings const & {
        return s;
    }

    /** \brief Multiscaler bin width, in seconds. */
    [[nodiscard]] auto binwidth() const noexcept -> double {
        return s.binwidth;
    }

    /** \brief Laser repetition rate, in Hz (0 if unknown). */
    [[nodiscard]] auto reprate() const noexcept -> double { return s.reprate; }

    /** \brief Pixels along the line axis. */
    [[nodiscard]] auto x_pixels() const noexcept -> std::size_t {
        return s.x_pixels;
    }

    /** \brief Pixels within each line. */
    [[nodiscard]] auto y_pixels() const noexcept -> std::size_t {
        return s.y_pixels;
    }

    /** \brief Depth planes. */
    [[nodiscard]] auto z_pixels() const noexcept -> std::size_t {
        return s.z_pixels;
    }

    /** \brief Lines per frame (resolved). */
    [[nodiscard]] auto lines_per_frame() const noexcept -> std::size_t {
        return s.lines_per_frame;
    }

    /** \brief Expected number of frames, if known. */
    [[nodiscard]] auto num_of_frames() const noexcept
        -> std::optional<std::size_t> {
        return s.num_of_frames;
    }

    /** \brief Whether the scan is bidirectional. */
    [[nodiscard]] auto bidir() const noexcept -> bool { return s.bidir; }

    /** \brief Whether to keep return-line photons in unidirectional mode. */
    [[nodiscard]] auto keep_unidir() const noexcept -> bool {
        return s.keep_unidir;
    }

    /** \brief Phase delay between forward and return lines, in radians. */
    [[nodiscard]] auto phase() const noexcept -> double { return s.phase; }

    /** \brief Fill fraction, in percent. */
    [[nodiscard]] auto fill_frac() const noexcept -> double {
        return s.fill_frac;
    }

    /** \brief Number of detector channels. */
    [[nodiscard]] auto num_of_channels() const noexcept -> std::size_t {
        return s.num_of_channels;
    }

    /** \brief Whether sweeps were used. */
    [[nodiscard]] auto use_sweeps() const noexcept -> bool {
        return s.use_sweeps;
    }

    /** \brief Whether to run the censor correction pass. */
    [[nodiscard]] auto censor() const noexcept -> bool { return s.censor; }

    /** \brief Censor correction behavior. */
    [[nodiscard]] auto censoring() const noexcept -> censor_policy {
        return s.censoring;
    }

    /** \brief Whether FLIM (pulse-relative time) is requested. */
    [[nodiscard]] auto flim() const noexcept -> bool { return s.flim; }

    /** \brief Histogram overflow behavior. */
    [[nodiscard]] auto overflow() const noexcept -> overflow_policy {
        return s.overflow;
    }

    /** \brief Requested outputs. */
    [[nodiscard]] auto outputs() const noexcept -> output_kind {
        return s.outputs;
    }

    /** \brief Marker spacing tolerance. */
    [[nodiscard]] auto jitter() const noexcept -> double { return s.jitter; }
};

} // namespace pscan
