#pragma once

#include <evgen/core/event.hpp>

#include <string>
#include <vector>

namespace evgen::core {

/// @brief Process producing a fixed number of events at a fixed cadence.
///
/// Event @c i arrives at `first_arrival + i * interarrival_time` and every
/// event carries the same duration.
///
/// @ingroup core_processes
/// @see Process
class PeriodicProcess {
public:
    /// @brief Construct a periodic process.
    /// @param name               Process name copied into each event.
    /// @param duration           Service demand shared by every event.
    /// @param interarrival_time  Spacing between consecutive arrivals.
    /// @param first_arrival      Arrival time of event 0.
    /// @param num_repetitions    Number of events to produce.
    /// Negative interarrival times are rejected along with the other negative
    /// parameters, so arrivals never decrease and never go below zero.
    ///
    /// @throws InvalidParameterError  If any parameter is negative, if the
    ///                                last arrival time does not fit in a Tick,
    ///                                or if @p num_repetitions exceeds the
    ///                                maximum size of an event vector.
    PeriodicProcess(std::string name,
                    Tick duration,
                    Tick interarrival_time,
                    Tick first_arrival,
                    Tick num_repetitions);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Tick duration() const noexcept { return duration_; }
    [[nodiscard]] Tick interarrival_time() const noexcept { return interarrival_time_; }
    [[nodiscard]] Tick first_arrival() const noexcept { return first_arrival_; }
    [[nodiscard]] Tick num_repetitions() const noexcept { return num_repetitions_; }

    /// @brief Return exactly num_repetitions() events in increasing arrival order.
    [[nodiscard]] std::vector<Event> generate_events() const;

private:
    std::string name_;
    Tick duration_;
    Tick interarrival_time_;
    Tick first_arrival_;
    Tick num_repetitions_;
};

} // namespace evgen::core
