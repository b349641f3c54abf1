#pragma once

#include <evgen/core/event.hpp>

#include <string>
#include <vector>

namespace evgen::core {

/// @brief Process producing exactly one event.
/// @ingroup core_processes
/// @see Process
class SingletonProcess {
public:
    /// @brief Construct a single-shot process.
    /// @param name      Process name copied into the event.
    /// @param duration  Service demand of the event.
    /// @param arrival   Arrival time of the event.
    /// @throws InvalidParameterError  If @p duration or @p arrival is negative.
    SingletonProcess(std::string name, Tick duration, Tick arrival);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Tick duration() const noexcept { return duration_; }
    [[nodiscard]] Tick arrival() const noexcept { return arrival_; }

    /// @brief Return a one-element sequence `(name, arrival, duration)`.
    [[nodiscard]] std::vector<Event> generate_events() const;

private:
    std::string name_;
    Tick duration_;
    Tick arrival_;
};

} // namespace evgen::core
