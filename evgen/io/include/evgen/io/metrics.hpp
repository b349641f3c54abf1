#pragma once

/// @file metrics.hpp
/// @brief Per-process statistics over a generated event stream.
/// @ingroup io_metrics

#include <evgen/core/event.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace evgen::io {

/// @brief Summary statistics of the events of one process.
///
/// @ingroup io_metrics
/// @see summarize
struct ProcessSummary {
    std::string name;                 ///< Process name.
    std::size_t event_count{0};       ///< Number of events.
    core::Tick total_duration{0};     ///< Sum of event durations, saturating at the Tick range.
    double mean_duration{0.0};        ///< Mean duration, computed without saturation.
    core::Tick first_arrival{0};      ///< Earliest arrival time.
    core::Tick last_arrival{0};       ///< Latest arrival time.
    double mean_interarrival{0.0};    ///< Mean gap between arrivals (0 with fewer than two events).
};

/// @brief Compute one summary per process appearing in @p events.
///
/// Summaries are returned in order of first appearance of each process
/// name. Events of a process need not be contiguous or sorted.
///
/// @param events  Any event stream, merged or per-process.
/// @return One ProcessSummary per distinct process name.
std::vector<ProcessSummary> summarize(const std::vector<core::Event>& events);

} // namespace evgen::io
