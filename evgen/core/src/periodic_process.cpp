#include <evgen/core/periodic_process.hpp>
#include <evgen/core/checks.hpp>
#include <evgen/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

namespace evgen::core {

PeriodicProcess::PeriodicProcess(std::string name,
                                 Tick duration,
                                 Tick interarrival_time,
                                 Tick first_arrival,
                                 Tick num_repetitions)
    : name_(std::move(name))
    , duration_(duration)
    , interarrival_time_(interarrival_time)
    , first_arrival_(first_arrival)
    , num_repetitions_(num_repetitions) {
    require_non_negative(duration_, "duration");
    require_non_negative(interarrival_time_, "interarrival_time");
    require_non_negative(first_arrival_, "first_arrival");
    require_non_negative(num_repetitions_, "num_repetitions");

    if (static_cast<std::uint64_t>(num_repetitions_) > std::vector<Event>{}.max_size()) {
        throw InvalidParameterError("num_repetitions exceeds the maximum event sequence size");
    }

    // Last arrival is first_arrival + (n - 1) * interarrival_time
    if (num_repetitions_ > 1 && interarrival_time_ > 0) {
        Tick headroom = std::numeric_limits<Tick>::max() - first_arrival_;
        if (num_repetitions_ - 1 > headroom / interarrival_time_) {
            throw InvalidParameterError("periodic process arrivals overflow the time range");
        }
    }
}

std::vector<Event> PeriodicProcess::generate_events() const {
    std::vector<Event> events;
    events.reserve(static_cast<std::size_t>(num_repetitions_));
    for (Tick idx = 0; idx < num_repetitions_; ++idx) {
        events.emplace_back(name_, first_arrival_ + idx * interarrival_time_, duration_);
    }
    return events;
}

} // namespace evgen::core
