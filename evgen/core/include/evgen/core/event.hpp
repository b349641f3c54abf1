#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace evgen::core {

/// @brief Simulation clock value, in integer time units.
/// @ingroup core_events
using Tick = std::int64_t;

/// @brief An arrival of work produced by a process.
///
/// Plain immutable value: the process name is copied in, so an Event keeps
/// no reference to the process that produced it. No validation is done
/// here; generators are responsible for emitting non-negative times.
///
/// @ingroup core_events
/// @see EventTiming, ScheduledEvent
class Event {
public:
    /// @brief Construct an event.
    /// @param process_name  Name of the producing process.
    /// @param arrival_time  Time at which the event becomes active.
    /// @param duration      Service demand of the event.
    Event(std::string process_name, Tick arrival_time, Tick duration)
        : process_name_(std::move(process_name))
        , arrival_time_(arrival_time)
        , duration_(duration) {}

    /// @brief Get the name of the producing process.
    [[nodiscard]] const std::string& process_name() const noexcept { return process_name_; }

    /// @brief Get the arrival time.
    [[nodiscard]] Tick arrival_time() const noexcept { return arrival_time_; }

    /// @brief Get the service demand.
    [[nodiscard]] Tick duration() const noexcept { return duration_; }

    /// @brief Value equality over name, arrival and duration.
    bool operator==(const Event& rhs) const = default;

private:
    std::string process_name_;
    Tick arrival_time_;
    Tick duration_;
};

/// @brief Start and wait times assigned to an event by a scheduling consumer.
///
/// Kept apart from Event so that events stay immutable values; the
/// generators never read or write timings.
///
/// @ingroup core_events
struct EventTiming {
    Tick start_time{0};  ///< Time at which service began.
    Tick wait_time{0};   ///< Time spent between arrival and start.
};

/// @brief An event paired with the timing slot a scheduler fills in.
/// @ingroup core_events
struct ScheduledEvent {
    Event event;         ///< Copy of the generated event.
    EventTiming timing;  ///< Zeroed until a scheduler assigns it.
};

/// @brief Build one zero-timed ScheduledEvent per event, preserving order.
/// @param events  Generated events (copied).
/// @return Annotated events, same size and order as @p events.
std::vector<ScheduledEvent> annotate(const std::vector<Event>& events);

} // namespace evgen::core
