/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#include "libpscan/movie_outputs.hpp"

#include "libpscan/data_types.hpp"
#include "libpscan/nd_array.hpp"
#include "libpscan/test_utils.hpp"

// Trompeloeil requires catch2 to be included first, but does not define which
// subset of Catch2 3.x is required. So include catch_all.hpp.
#include <catch2/catch_all.hpp>
#include <catch2/trompeloeil.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pscan {

namespace {

class mock_store : public volume_store<> {
  public:
    MAKE_MOCK4(write_volume,
               void(std::string const &, std::string const &, std::size_t,
                    nd_array<i16> const &),
               override);
    MAKE_MOCK3(write_array,
               void(std::string const &, std::string const &,
                    nd_array<i64> const &),
               override);
    MAKE_MOCK0(close, void(), override);
};

auto event(u32 channel, std::size_t index, std::vector<i16> counts)
    -> volume_histogram_event<> {
    return {channel, index, nd_array<i16>({2}, std::move(counts))};
}

} // namespace

TEST_CASE("channel dataset names") {
    CHECK(channel_dataset_name(1) == "Channel 1");
    CHECK(std::string(full_stack_group) == "Full Stack");
    CHECK(std::string(summed_stack_group) == "Summed Stack");
}

TEST_CASE("memory output keeps running sum and stack") {
    auto mem = std::make_shared<movie_memory<>>();
    memory_output<> out(mem);
    out.handle(event(1, 0, {1, 2}));
    out.handle(event(1, 1, {3, 0}));
    out.handle(event(2, 0, {0, 5}));

    CHECK_FALSE(mem->is_finalized());
    CHECK_THROWS_AS(mem->stack(1), std::logic_error);
    CHECK(mem->running_sum(1).data() == std::vector<i64>{4, 2});

    out.flush();
    REQUIRE(mem->is_finalized());
    CHECK(mem->channels() == std::vector<u32>{1, 2});
    auto const &stack = mem->stack(1);
    CHECK(stack.shape() == std::vector<std::size_t>{2, 2});
    CHECK(stack.data() == std::vector<i16>{1, 2, 3, 0});
    CHECK(mem->stack(2).data() == std::vector<i16>{0, 5});
    CHECK_THROWS_AS(mem->running_sum(3), std::out_of_range);
    CHECK_THROWS_AS(out.handle(event(1, 2, {0, 0})), std::logic_error);
}

TEST_CASE("memory output rejects out-of-order volumes") {
    auto mem = std::make_shared<movie_memory<>>();
    memory_output<> out(mem);
    out.handle(event(1, 0, {1, 2}));
    CHECK_THROWS_AS(out.handle(event(1, 2, {1, 2})), std::invalid_argument);
}

TEST_CASE("outputs require a destination") {
    CHECK_THROWS_AS(memory_output<>(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(stack_output<>(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(summed_output<>(nullptr), std::invalid_argument);
}

TEST_CASE("stack output writes each volume as it arrives") {
    using trompeloeil::_;
    auto store = std::make_shared<mock_store>();
    stack_output<> out(store);

    trompeloeil::sequence seq;
    REQUIRE_CALL(*store, write_volume("Full Stack", "Channel 1", 0, _))
        .WITH(_4.data() == std::vector<i16>{1, 2})
        .IN_SEQUENCE(seq);
    REQUIRE_CALL(*store, write_volume("Full Stack", "Channel 1", 1, _))
        .IN_SEQUENCE(seq);
    REQUIRE_CALL(*store, write_volume("Full Stack", "Channel 2", 0, _))
        .IN_SEQUENCE(seq);
    FORBID_CALL(*store, write_array(_, _, _));
    FORBID_CALL(*store, close());

    out.handle(event(1, 0, {1, 2}));
    out.handle(event(1, 1, {3, 4}));
    out.handle(event(2, 0, {5, 6}));
    out.flush();
}

TEST_CASE("summed output writes running sums on flush") {
    using trompeloeil::_;
    auto store = std::make_shared<mock_store>();
    summed_output<> out(store);

    out.handle(event(1, 0, {1, 2}));
    out.handle(event(1, 1, {3, 4}));
    out.handle(event(2, 0, {5, 6}));

    trompeloeil::sequence seq;
    REQUIRE_CALL(*store, write_array("Summed Stack", "Channel 1", _))
        .WITH(_3.data() == std::vector<i64>{4, 6})
        .IN_SEQUENCE(seq);
    REQUIRE_CALL(*store, write_array("Summed Stack", "Channel 2", _))
        .WITH(_3.data() == std::vector<i64>{5, 6})
        .IN_SEQUENCE(seq);
    out.flush();
}

TEST_CASE("in-memory store records writes") {
    auto store = std::make_shared<in_memory_store<>>();
    stack_output<> stack(store);
    summed_output<> summed(store);
    for (auto *out : std::vector<movie_output<> *>{&stack, &summed}) {
        out->handle(event(1, 0, {1, 2}));
        out->handle(event(1, 1, {3, 4}));
        out->flush();
    }
    auto const vols = store->volumes("Full Stack", "Channel 1");
    REQUIRE(vols.size() == 2);
    CHECK(vols.at(1).data() == std::vector<i16>{3, 4});
    REQUIRE(store->has_array("Summed Stack", "Channel 1"));
    CHECK(store->array("Summed Stack", "Channel 1").data() ==
          std::vector<i64>{4, 6});
    CHECK_FALSE(store->is_closed());
}

} // namespace pscan
