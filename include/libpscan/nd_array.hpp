/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Dense row-major multi-dimensional array.
 *
 * \ingroup nd-array
 *
 * \tparam T element type
 */
template <typename T> class nd_array {
    std::vector<std::size_t> shp;
    std::vector<T> elems;

    static auto element_count(std::vector<std::size_t> const &shape)
        -> std::size_t {
        return std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                               std::multiplies<>());
    }

  public:
    /** \brief The element type. */
    using value_type = T;

    /** \brief Construct an empty (rank 0, size 0) array. */
    nd_array() = default;

    /** \brief Construct a zero-filled array of the given shape. */
    explicit nd_array(std::vector<std::size_t> shape)
        : shp(std::move(shape)), elems(element_count(shp), T{0}) {}

    /**
     * \brief Construct from a shape and row-major elements.
     *
     * \throws std::invalid_argument if the element count does not match
     */
    explicit nd_array(std::vector<std::size_t> shape, std::vector<T> data)
        : shp(std::move(shape)), elems(std::move(data)) {
        if (elems.size() != element_count(shp))
            throw std::invalid_argument(
                "nd_array data size does not match shape");
    }

    /** \brief Return the shape. */
    [[nodiscard]] auto shape() const noexcept
        -> std::vector<std::size_t> const & {
        return shp;
    }

    /** \brief Return the number of dimensions. */
    [[nodiscard]] auto rank() const noexcept -> std::size_t {
        return shp.size();
    }

    /** \brief Return the number of elements. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return elems.size();
    }

    /** \brief Return the row-major elements. */
    [[nodiscard]] auto data() const noexcept -> std::vector<T> const & {
        return elems;
    }

    /** \brief Return the row-major elements. */
    [[nodiscard]] auto data() noexcept -> std::vector<T> & { return elems; }

    /** \brief Access an element by flat (row-major) index. */
    auto operator[](std::size_t flat_index) const -> T const & {
        return elems[flat_index];
    }

    /** \brief Access an element by flat (row-major) index. */
    auto operator[](std::size_t flat_index) -> T & {
        return elems[flat_index];
    }

    /**
     * \brief Return the flat index of a multi-dimensional index.
     *
     * \throws std::out_of_range if the index is invalid
     */
    [[nodiscard]] auto flat_index(std::initializer_list<std::size_t> index)
        const -> std::size_t {
        if (index.size() != shp.size())
            throw std::out_of_range("nd_array index has wrong rank");
        std::size_t flat = 0;
        auto dim = shp.begin();
        for (auto const i : index) {
            if (i >= *dim)
                throw std::out_of_range("nd_array index out of range");
            flat = flat * *dim + i;
            ++dim;
        }
        return flat;
    }

    /** \brief Access an element by multi-dimensional index. */
    [[nodiscard]] auto at(std::initializer_list<std::size_t> index) const
        -> T const & {
        return elems[flat_index(index)];
    }

    /** \brief Access an element by multi-dimensional index. */
    auto at(std::initializer_list<std::size_t> index) -> T & {
        return elems[flat_index(index)];
    }

    /** \brief Return the sum of all elements, computed in type \p U. */
    template <typename U = T> [[nodiscard]] auto sum() const -> U {
        U total{0};
        for (auto const e : elems)
            total += static_cast<U>(e);
        return total;
    }

    /**
     * \brief Add another array elementwise.
     *
     * \throws std::invalid_argument if the shapes differ
     */
    template <typename U> auto operator+=(nd_array<U> const &other)
        -> nd_array & {
        if (other.shape() != shp)
            throw std::invalid_argument(
                "nd_array shapes differ in elementwise addition");
        std::transform(elems.begin(), elems.end(), other.data().begin(),
                       elems.begin(), [](T lhs, U rhs) {
                           return static_cast<T>(lhs + static_cast<T>(rhs));
                       });
        return *this;
    }

    /** \brief Return sub-array \p index along the first dimension. */
    [[nodiscard]] auto slice(std::size_t index) const -> nd_array {
        if (shp.empty() || index >= shp.front())
            throw std::out_of_range("nd_array slice index out of range");
        std::vector<std::size_t> const sub_shape(std::next(shp.begin()),
                                                 shp.end());
        auto const n = element_count(sub_shape);
        auto const begin =
            std::next(elems.begin(), static_cast<long>(index * n));
        return nd_array(sub_shape,
                        std::vector<T>(begin, std::next(begin,
                                                        static_cast<long>(n))));
    }

    /** \brief Equality comparison operator. */
    friend auto operator==(nd_array const &lhs, nd_array const &rhs) -> bool {
        return lhs.shp == rhs.shp && lhs.elems == rhs.elems;
    }

    /** \brief Inequality comparison operator. */
    friend auto operator!=(nd_array const &lhs, nd_array const &rhs) -> bool {
        return not(lhs == rhs);
    }
};

/**
 * \brief Stack arrays of equal shape along a new leading dimension.
 *
 * \ingroup nd-array
 *
 * \param arrays the arrays, in order
 *
 * \param item_shape shape of each array; used for the result when \p arrays
 * is empty
 *
 * \throws std::invalid_argument if an array's shape differs from
 * \p item_shape
 */
template <typename T>
auto stack_arrays(std::vector<nd_array<T>> const &arrays,
                  std::vector<std::size_t> const &item_shape) -> nd_array<T> {
    std::vector<std::size_t> shape{arrays.size()};
    shape.insert(shape.end(), item_shape.begin(), item_shape.end());
    std::vector<T> data;
    for (auto const &a : arrays) {
        if (a.shape() != item_shape)
            throw std::invalid_argument(
                "cannot stack arrays of differing shapes");
        data.insert(data.end(), a.data().begin(), a.data().end());
    }
    return nd_array<T>(std::move(shape), std::move(data));
}

} // namespace pscan
