#include <evgen/core/stochastic_process.hpp>
#include <evgen/core/checks.hpp>
#include <evgen/core/error.hpp>

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <utility>

namespace evgen::core {

namespace {

// Truncate a non-negative sample toward zero, saturating at the Tick range
Tick truncate_sample(double sample, const char* source) {
    if (std::isnan(sample) || sample < 0.0) {
        throw SamplerError(std::string(source) + " source produced an invalid sample");
    }
    constexpr Tick MAX_TICK = std::numeric_limits<Tick>::max();
    if (sample >= static_cast<double>(MAX_TICK)) {
        return MAX_TICK;
    }
    return static_cast<Tick>(sample);
}

} // anonymous namespace

std::vector<Event> generate_renewal_events(const std::string& name,
                                           Tick first_arrival,
                                           Tick end_time,
                                           VariateSource& durations,
                                           VariateSource& gaps) {
    require_non_negative(first_arrival, "first_arrival");

    std::vector<Event> events;
    Tick arrival = first_arrival;

    while (arrival < end_time) {
        Tick duration = truncate_sample(durations.next(), "duration");
        events.emplace_back(name, arrival, duration);

        Tick gap = truncate_sample(gaps.next(), "interarrival");
        // arrival >= 0 and arrival < end_time, so the difference cannot overflow
        if (gap >= end_time - arrival) {
            break;
        }
        arrival += gap;
    }

    return events;
}

StochasticProcess::StochasticProcess(std::string name,
                                     double mean_duration,
                                     double mean_interarrival_time,
                                     Tick first_arrival,
                                     Tick end_time,
                                     std::optional<std::uint64_t> seed)
    : name_(std::move(name))
    , mean_duration_(mean_duration)
    , mean_interarrival_time_(mean_interarrival_time)
    , first_arrival_(first_arrival)
    , end_time_(end_time)
    , seed_(seed) {
    require_positive_mean(mean_duration_, "mean_duration");
    require_positive_mean(mean_interarrival_time_, "mean_interarrival_time");
    require_non_negative(first_arrival_, "first_arrival");
}

std::vector<Event> StochasticProcess::generate_events() const {
    std::mt19937 seeder;
    if (seed_.has_value()) {
        std::seed_seq seq{static_cast<std::uint32_t>(seed_.value()),
                          static_cast<std::uint32_t>(seed_.value() >> 32U)};
        seeder.seed(seq);
    } else {
        std::random_device rd;
        seeder.seed(rd());
    }

    // Derive one independent engine seed per distribution
    ExponentialSampler durations(mean_duration_, seeder());
    ExponentialSampler gaps(mean_interarrival_time_, seeder());

    return generate_renewal_events(name_, first_arrival_, end_time_, durations, gaps);
}

} // namespace evgen::core
