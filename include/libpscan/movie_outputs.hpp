/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "data_types.hpp"
#include "nd_array.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief Group under which per-volume histograms are persisted.
 *
 * \ingroup movie-outputs
 */
inline constexpr char const *full_stack_group = "Full Stack";

/**
 * \brief Group under which per-channel running sums are persisted.
 *
 * \ingroup movie-outputs
 */
inline constexpr char const *summed_stack_group = "Summed Stack";

/**
 * \brief Return the dataset name of a channel (`"Channel 1"`, ...).
 *
 * \ingroup movie-outputs
 */
inline auto channel_dataset_name(u32 channel) -> std::string {
    return "Channel " + std::to_string(channel);
}

/**
 * \brief Event carrying the finished histogram of one (channel, volume) pair.
 *
 * \ingroup events-movie
 *
 * \tparam DataTypes data type set specifying `bin_type`
 */
template <typename DataTypes = default_data_types>
struct volume_histogram_event {
    /** \brief Detector channel number. */
    u32 channel;

    /** \brief Volume index within the channel. */
    std::size_t volume_index;

    /** \brief Photon counts. */
    nd_array<typename DataTypes::bin_type> counts;
};

/**
 * \brief Interface of a movie output handler.
 *
 * \ingroup movie-outputs
 *
 * Handlers receive every (channel, volume) histogram in order: channels
 * ascending, and within each channel volumes ascending. `flush()` is called
 * once after the last histogram.
 *
 * \tparam DataTypes data type set specifying `bin_type`
 */
template <typename DataTypes = default_data_types> class movie_output {
  public:
    movie_output() = default;
    movie_output(movie_output const &) = delete;
    auto operator=(movie_output const &) = delete;
    movie_output(movie_output &&) = delete;
    auto operator=(movie_output &&) = delete;
    virtual ~movie_output() = default;

    /** \brief Accept the histogram of one (channel, volume) pair. */
    virtual void handle(volume_histogram_event<DataTypes> const &event) = 0;

    /** \brief Finalize after the last histogram. */
    virtual void flush() = 0;
};

/**
 * \brief Interface of the persistence collaborator.
 *
 * \ingroup movie-outputs
 *
 * Implementations write arrays into named datasets within named groups
 * (typically an HDF5 or Zarr file).
 *
 * \tparam DataTypes data type set specifying `bin_type` and
 * `summed_bin_type`
 */
template <typename DataTypes = default_data_types> class volume_store {
  public:
    volume_store() = default;
    volume_store(volume_store const &) = delete;
    auto operator=(volume_store const &) = delete;
    volume_store(volume_store &&) = delete;
    auto operator=(volume_store &&) = delete;
    virtual ~volume_store() = default;

    /** \brief Write one volume of a stack dataset. */
    virtual void
    write_volume(std::string const &group, std::string const &dataset,
                 std::size_t volume_index,
                 nd_array<typename DataTypes::bin_type> const &volume) = 0;

    /** \brief Write a whole dataset. */
    virtual void
    write_array(std::string const &group, std::string const &dataset,
                nd_array<typename DataTypes::summed_bin_type> const &array) = 0;

    /** \brief Release the underlying storage. */
    virtual void close() = 0;
};

/**
 * \brief In-memory results of a movie: per channel, the running sum and the
 * ordered stack of volume histograms.
 *
 * \ingroup movie-outputs
 *
 * Filled by `pscan::memory_output`. The stack of each channel is available
 * after `finalize()`.
 *
 * \tparam DataTypes data type set specifying `bin_type` and
 * `summed_bin_type`
 */
template <typename DataTypes = default_data_types> class movie_memory {
    using bin_type = typename DataTypes::bin_type;
    using summed_bin_type = typename DataTypes::summed_bin_type;

    struct channel_outputs {
        nd_array<summed_bin_type> running_sum;
        std::vector<nd_array<bin_type>> ordered_stack;
        nd_array<bin_type> stack;
    };

    std::map<u32, channel_outputs> chans;
    bool done = false;

    auto find(u32 channel) const -> channel_outputs const & {
        auto const it = chans.find(channel);
        if (it == chans.end())
            throw std::out_of_range("no movie data for channel " +
                                    std::to_string(channel));
        return it->second;
    }

  public:
    /**
     * \brief Append the histogram of the next volume of a channel.
     *
     * \throws std::logic_error if called after `finalize()`
     *
     * \throws std::invalid_argument if the volume is out of order or its
     * shape differs from earlier volumes
     */
    void append(volume_histogram_event<DataTypes> const &event) {
        if (done)
            throw std::logic_error("movie_memory already finalized");
        auto &c = chans[event.channel];
        if (event.volume_index != c.ordered_stack.size())
            throw std::invalid_argument("volume received out of order");
        if (c.ordered_stack.empty())
            c.running_sum = nd_array<summed_bin_type>(event.counts.shape());
        c.running_sum += event.counts;
        c.ordered_stack.push_back(event.counts);
    }

    /** \brief Combine each channel's volumes into one stacked array. */
    void finalize() {
        for (auto &entry : chans) {
            auto &c = entry.second;
            c.stack = stack_arrays(c.ordered_stack, c.running_sum.shape());
            c.ordered_stack.clear();
            c.ordered_stack.shrink_to_fit();
        }
        done = true;
    }

    /** \brief Return true once `finalize()` has been called. */
    [[nodiscard]] auto is_finalized() const noexcept -> bool { return done; }

    /** \brief Return the channel numbers with data, ascending. */
    [[nodiscard]] auto channels() const -> std::vector<u32> {
        std::vector<u32> ret;
        for (auto const &entry : chans)
            ret.push_back(entry.first);
        return ret;
    }

    /**
     * \brief Return the elementwise sum of a channel's volumes.
     *
     * \throws std::out_of_range if there is no data for \p channel
     */
    [[nodiscard]] auto running_sum(u32 channel) const
        -> nd_array<summed_bin_type> const & {
        return find(channel).running_sum;
    }

    /**
     * \brief Return a channel's volumes stacked along a leading dimension.
     *
     * \throws std::logic_error if not finalized
     *
     * \throws std::out_of_range if there is no data for \p channel
     */
    [[nodiscard]] auto stack(u32 channel) const -> nd_array<bin_type> const & {
        if (not done)
            throw std::logic_error("movie_memory not finalized");
        return find(channel).stack;
    }
};

/**
 * \brief Movie output keeping the running sum and stack in memory.
 *
 * \ingroup movie-outputs
 *
 * \tparam DataTypes data type set specifying `bin_type` and
 * `summed_bin_type`
 */
template <typename DataTypes = default_data_types>
class memory_output final : public movie_output<DataTypes> {
    std::shared_ptr<movie_memory<DataTypes>> mem;

  public:
    /** \brief Construct with the memory to fill. */
    explicit memory_output(std::shared_ptr<movie_memory<DataTypes>> memory)
        : mem(std::move(memory)) {
        if (not mem)
            throw std::invalid_argument("memory_output requires a memory");
    }

    void handle(volume_histogram_event<DataTypes> const &event) override {
        mem->append(event);
    }

    void flush() override { mem->finalize(); }
};

/**
 * \brief Movie output persisting every volume histogram as it is produced.
 *
 * \ingroup movie-outputs
 *
 * Volumes are written to dataset `"Channel {n}"` of group `"Full Stack"`.
 *
 * \tparam DataTypes data type set specifying `bin_type`
 */
template <typename DataTypes = default_data_types>
class stack_output final : public movie_output<DataTypes> {
    std::shared_ptr<volume_store<DataTypes>> store;

  public:
    /** \brief Construct with the store to write to. */
    explicit stack_output(std::shared_ptr<volume_store<DataTypes>> store)
        : store(std::move(store)) {
        if (not this->store)
            throw std::invalid_argument("stack_output requires a store");
    }

    void handle(volume_histogram_event<DataTypes> const &event) override {
        store->write_volume(full_stack_group,
                            channel_dataset_name(event.channel),
                            event.volume_index, event.counts);
    }

    void flush() override {}
};

/**
 * \brief Movie output persisting each channel's running sum at the end.
 *
 * \ingroup movie-outputs
 *
 * Sums are written to dataset `"Channel {n}"` of group `"Summed Stack"`.
 *
 * \tparam DataTypes data type set specifying `bin_type` and
 * `summed_bin_type`
 */
template <typename DataTypes = default_data_types>
class summed_output final : public movie_output<DataTypes> {
    using summed_bin_type = typename DataTypes::summed_bin_type;

    std::shared_ptr<volume_store<DataTypes>> store;
    std::map<u32, nd_array<summed_bin_type>> sums;

  public:
    /** \brief Construct with the store to write to. */
    explicit summed_output(std::shared_ptr<volume_store<DataTypes>> store)
        : store(std::move(store)) {
        if (not this->store)
            throw std::invalid_argument("summed_output requires a store");
    }

    void handle(volume_histogram_event<DataTypes> const &event) override {
        auto [it, inserted] = sums.try_emplace(event.channel);
        if (inserted)
            it->second = nd_array<summed_bin_type>(event.counts.shape());
        it->second += event.counts;
    }

    void flush() override {
        for (auto const &[channel, sum] : sums)
            store->write_array(summed_stack_group,
                               channel_dataset_name(channel), sum);
    }
};

} // namespace pscan
