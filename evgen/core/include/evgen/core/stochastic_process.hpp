#pragma once

#include <evgen/core/event.hpp>
#include <evgen/core/sampler.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evgen::core {

/// @brief Run the renewal loop over two injected variate sources.
///
/// Starting with a cursor at @p first_arrival, and while the cursor is
/// strictly below @p end_time: draw a duration from @p durations, emit
/// `(name, cursor, duration)`, then advance the cursor by a gap drawn from
/// @p gaps. Both samples are truncated toward zero, so zero durations and
/// zero gaps are legitimate.
///
/// The horizon bounds arrivals only: the last event may complete after
/// @p end_time. There is no iteration cap; a gap source whose samples
/// truncate to 0 forever never terminates and is a caller error.
///
/// @param name           Process name copied into each event.
/// @param first_arrival  Initial cursor value (>= 0).
/// @param end_time       Exclusive upper bound on arrival times.
/// @param durations      Source of service-time samples.
/// @param gaps           Source of inter-arrival samples.
/// @return Events in emission order, with non-decreasing arrival times.
///
/// @throws InvalidParameterError  If @p first_arrival is negative.
/// @throws SamplerError           If a source returns a negative or NaN sample.
///
/// @ingroup core_processes
std::vector<Event> generate_renewal_events(const std::string& name,
                                           Tick first_arrival,
                                           Tick end_time,
                                           VariateSource& durations,
                                           VariateSource& gaps);

/// @brief Renewal process with exponential service and inter-arrival times.
///
/// Each call to generate_events() builds two fresh ExponentialSampler
/// instances, one per distribution. When a seed is supplied, both sampler
/// seeds are derived from it, so every call (and every process constructed
/// with the same parameters and seed) yields the same sequence. Without a
/// seed, each call draws fresh entropy from std::random_device.
///
/// @ingroup core_processes
/// @see generate_renewal_events, Process
class StochasticProcess {
public:
    /// @brief Construct a stochastic renewal process.
    /// @param name                    Process name copied into each event.
    /// @param mean_duration           Mean of the exponential service time.
    /// @param mean_interarrival_time  Mean of the exponential inter-arrival gap.
    /// @param first_arrival           Arrival time of the first event.
    /// @param end_time                Exclusive horizon on arrival times.
    /// @param seed                    Optional seed making the output reproducible.
    /// @throws InvalidParameterError  If a mean is not finite and positive, or
    ///                                @p first_arrival is negative.
    StochasticProcess(std::string name,
                      double mean_duration,
                      double mean_interarrival_time,
                      Tick first_arrival,
                      Tick end_time,
                      std::optional<std::uint64_t> seed = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] double mean_duration() const noexcept { return mean_duration_; }
    [[nodiscard]] double mean_interarrival_time() const noexcept { return mean_interarrival_time_; }
    [[nodiscard]] Tick first_arrival() const noexcept { return first_arrival_; }
    [[nodiscard]] Tick end_time() const noexcept { return end_time_; }
    [[nodiscard]] std::optional<std::uint64_t> seed() const noexcept { return seed_; }

    /// @brief Sample one realisation of the process up to end_time().
    [[nodiscard]] std::vector<Event> generate_events() const;

private:
    std::string name_;
    double mean_duration_;
    double mean_interarrival_time_;
    Tick first_arrival_;
    Tick end_time_;
    std::optional<std::uint64_t> seed_;
};

} // namespace evgen::core
