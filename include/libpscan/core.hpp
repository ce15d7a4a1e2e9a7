/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace pscan {

/**
 * \brief An event type indicating a warning.
 *
 * \ingroup events-core
 *
 * Stages that encounter recoverable conditions (a noisy laser pulse train, a
 * degenerate volume, a missing output request) emit this event to a warning
 * sink instead of failing. A warning sink is any object with a member function
 * `handle(warning_event const &)`.
 */
struct warning_event {
    /** \brief A human-readable message describing the warning. */
    std::string message;

    /** \brief Equality comparison operator. */
    friend auto operator==(warning_event const &lhs,
                           warning_event const &rhs) noexcept -> bool {
        return lhs.message == rhs.message;
    }

    /** \brief Inequality comparison operator. */
    friend auto operator!=(warning_event const &lhs,
                           warning_event const &rhs) noexcept -> bool {
        return not(lhs == rhs);
    }

    /** \brief Stream insertion operator. */
    friend auto operator<<(std::ostream &stream,
                           warning_event const &event) -> std::ostream & {
        return stream << event.message;
    }
};

/**
 * \brief Sink that accepts any event and the end-of-stream and does nothing.
 *
 * \ingroup processors-core
 *
 * \par Events handled
 * - All types: ignore
 * - Flush: ignore
 */
class null_sink {
  public:
    /** \brief Implements processor requirement. */
    template <typename Event> void handle(Event const & /* event */) {}

    /** \brief Implements processor requirement. */
    void flush() {}
};

/**
 * \brief Warning sink that records warning messages in order of arrival.
 *
 * \ingroup processors-core
 *
 * Copies share nothing; pass by reference to stages that emit warnings.
 */
class warning_collector {
    std::vector<std::string> msgs;

  public:
    /** \brief Record a warning. */
    void handle(warning_event const &event) { msgs.push_back(event.message); }

    /** \brief Record a warning. */
    void handle(warning_event &&event) {
        msgs.push_back(std::move(event.message));
    }

    /** \brief Implements processor requirement. */
    void flush() {}

    /** \brief Return the recorded messages. */
    [[nodiscard]] auto messages() const noexcept
        -> std::vector<std::string> const & {
        return msgs;
    }

    /** \brief Return the number of recorded warnings. */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return msgs.size();
    }

    /** \brief Return true if any recorded message contains \p fragment. */
    [[nodiscard]] auto contains(std::string const &fragment) const -> bool {
        for (auto const &m : msgs) {
            if (m.find(fragment) != std::string::npos)
                return true;
        }
        return false;
    }

    /** \brief Discard all recorded messages. */
    void clear() noexcept { msgs.clear(); }
};

} // namespace pscan
