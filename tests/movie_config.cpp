/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/movie_config.hpp"

#include "libpscan/errors.hpp"
#include "libpscan/histogram_policies.hpp"
#include "libpscan/output_kinds.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <limits>
#include <stdexcept>

namespace pscan {

TEST_CASE("movie_config defaults") {
    movie_config const c{movie_settings{}};
    CHECK(c.binwidth() == 800e-12);
    CHECK(c.reprate() == 80e6);
    CHECK(c.x_pixels() == 512);
    CHECK(c.y_pixels() == 512);
    CHECK(c.z_pixels() == 1);
    CHECK(c.lines_per_frame() == 512);
    CHECK_FALSE(c.num_of_frames().has_value());
    CHECK(c.bidir());
    CHECK_FALSE(c.keep_unidir());
    CHECK(c.fill_frac() == 80.0);
    CHECK(c.num_of_channels() == 1);
    CHECK_FALSE(c.censor());
    CHECK_FALSE(c.flim());
    CHECK(c.overflow() == overflow_policy::saturate_on_overflow);
    CHECK(c.outputs() == output_kind::memory);
    CHECK(c.jitter() == 0.02);
}

TEST_CASE("movie_config explicit lines per frame") {
    movie_settings s;
    s.x_pixels = 64;
    s.lines_per_frame = 128;
    CHECK(movie_config{s}.lines_per_frame() == 128);
}

TEST_CASE("movie_config rejects invalid settings") {
    using Catch::Matchers::ContainsSubstring;
    movie_settings s;

    SECTION("binwidth") {
        s.binwidth = 0.0;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("binwidth"));
    }
    SECTION("reprate") {
        s.reprate = -1.0;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("reprate"));
    }
    SECTION("non-finite reprate") {
        s.reprate = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(movie_config{s}, configuration_error);
    }
    SECTION("pixels") {
        s.y_pixels = 0;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("y_pixels"));
    }
    SECTION("frames") {
        s.num_of_frames = 0;
        CHECK_THROWS_WITH(movie_config{s},
                          ContainsSubstring("num_of_frames"));
    }
    SECTION("fill fraction") {
        s.fill_frac = 100.5;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("fill_frac"));
    }
    SECTION("channels") {
        s.num_of_channels = 0;
        CHECK_THROWS_WITH(movie_config{s},
                          ContainsSubstring("num_of_channels"));
    }
    SECTION("censor under reject policy") {
        s.censor = true;
        s.censoring = censor_policy::reject;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("censor"));
    }
    SECTION("jitter") {
        s.jitter = 1.0;
        CHECK_THROWS_WITH(movie_config{s}, ContainsSubstring("jitter"));
    }
}

TEST_CASE("configuration_error is an invalid_argument") {
    movie_settings s;
    s.x_pixels = 0;
    CHECK_THROWS_AS(movie_config{s}, std::invalid_argument);
}

TEST_CASE("output_kind flags") {
    auto const k = output_kind::memory | output_kind::summed;
    CHECK(includes(k, output_kind::memory));
    CHECK(includes(k, output_kind::summed));
    CHECK_FALSE(includes(k, output_kind::stack));
    auto m = output_kind::none;
    m |= output_kind::stack;
    CHECK((m & output_kind::stack) == output_kind::stack);
}

} // namespace pscan
