/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/pscan.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using abstime_type = pscan::default_data_types::abstime_type;

void print_out(char const *str) {
    if (std::fputs(str, stdout) == EOF)
        std::terminate();
}

void print_err(char const *str) {
    if (std::fputs(str, stderr) == EOF)
        std::terminate();
}

// Simulate a bidirectional scan of a bright square on a dim background. Frame
// markers are not recorded; they are derived from the line markers.
auto simulate(std::size_t lines_per_frame, std::size_t num_frames,
              abstime_type line_period)
    -> std::map<std::string, std::vector<abstime_type>> {
    std::map<std::string, std::vector<abstime_type>> named;
    auto &lines = named["Lines"];
    auto &pmt1 = named["PMT1"];

    std::mt19937 rng(42); // NOLINT(cert-msc51-cpp)
    std::poisson_distribution<int> dim(0.5);
    std::poisson_distribution<int> bright(4.0);
    std::uniform_int_distribution<abstime_type> jitter(0, line_period / 64);

    auto const pixels = lines_per_frame;
    auto const pixel_period = line_period / pixels;
    for (std::size_t f = 0; f < num_frames; ++f) {
        for (std::size_t l = 0; l < lines_per_frame; ++l) {
            auto const line_start =
                static_cast<abstime_type>(f * lines_per_frame + l) *
                line_period;
            lines.push_back(line_start);
            for (std::size_t p = 0; p < pixels; ++p) {
                // Odd lines scan in reverse.
                auto const column = (l % 2 == 0) ? p : pixels - 1 - p;
                bool const in_square = l >= pixels / 4 && l < 3 * pixels / 4 &&
                                       column >= pixels / 4 &&
                                       column < 3 * pixels / 4;
                auto const n = in_square ? bright(rng) : dim(rng);
                for (int i = 0; i < n; ++i) {
                    auto const t = line_start + p * pixel_period +
                                   jitter(rng) % pixel_period;
                    pmt1.push_back(t);
                }
            }
        }
    }
    std::sort(pmt1.begin(), pmt1.end());
    return named;
}

auto reconstruct() -> bool {
    std::size_t const lpf = 64;
    std::size_t const frames = 8;

    pscan::movie_settings s;
    s.x_pixels = lpf;
    s.y_pixels = lpf;
    s.num_of_frames = frames;
    s.fill_frac = 100.0;
    s.reprate = 0.0;
    s.outputs = pscan::output_kind::memory;

    try {
        auto const channels =
            pscan::channel_data<>::from_named_tables(simulate(lpf, frames,
                                                              12800));
        pscan::warning_collector warnings;
        auto const result = pscan::reconstruct_movie(
            channels, pscan::movie_config(s), nullptr, warnings);

        for (auto const &msg : warnings.messages())
            print_err(("warning: " + msg + '\n').c_str());

        std::ostringstream stream;
        stream << "lines: " << result.markers.lines.size()
               << (result.markers.frames_synthesized ? " (frames derived)"
                                                     : "")
               << '\n';
        stream << "photons allocated: " << result.stats.allocated << " of "
               << result.stats.input << '\n';
        stream << "volumes: " << result.volume_times.size() - 1 << '\n';
        stream << "histograms: " << result.histograms_built << '\n';
        for (auto const ch : result.memory->channels()) {
            auto const &sum = result.memory->running_sum(ch);
            stream << pscan::channel_dataset_name(ch)
                   << ": total counts " << sum.sum<pscan::i64>() << '\n';
        }
        print_out(stream.str().c_str());
    } catch (std::exception const &exc) {
        print_err(exc.what());
        print_err("\n");
        return false;
    }
    return true;
}

auto main() -> int {
    try {
        return reconstruct() ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (std::exception const &exc) {
        print_err("error: ");
        print_err(exc.what());
        print_err("\n");
        return EXIT_FAILURE;
    }
}
