/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <type_traits>

namespace pscan::internal {

// Disable inlining; Must be placed _after_ standard attributes such as
// [[noreturn]], for MSVC.
#if defined(__GNUC__)
#define LIBPSCAN_NOINLINE [[gnu::noinline]]
#elif defined(_MSC_VER)
#define LIBPSCAN_NOINLINE __declspec(noinline)
#else
#define LIBPSCAN_NOINLINE
#endif

// C++20 std::remove_cvref[_t]
template <typename T> struct remove_cvref {
    using type = std::remove_cv_t<std::remove_reference_t<T>>;
};

template <typename T> using remove_cvref_t = typename remove_cvref<T>::type;

// C++20 std::type_identity
template <typename T> struct type_identity {
    using type = T;
};

template <typename T> using type_identity_t = typename type_identity<T>::type;

// Detect whether T has a handle() overload accepting Event const &.
template <typename T, typename Event, typename = void>
struct handles_event : std::false_type {};

template <typename T, typename Event>
struct handles_event<T, Event,
                     std::void_t<decltype(std::declval<T &>().handle(
                         std::declval<Event const &>()))>> : std::true_type {
};

template <typename T, typename Event>
inline constexpr bool handles_event_v = handles_event<T, Event>::value;

} // namespace pscan::internal
