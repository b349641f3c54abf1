#pragma once

/// @file event_stream.hpp
/// @brief Combining the outputs of several processes into one stream.
/// @ingroup core_events

#include <evgen/core/event.hpp>
#include <evgen/core/process.hpp>

#include <vector>

namespace evgen::core {

/// @brief Merge several event sequences into one ordered by arrival time.
///
/// The merge is stable: events with equal arrival times keep the order of
/// their input streams, then their emission order within a stream.
///
/// @param streams  Per-process event sequences.
/// @return All events, sorted by non-decreasing arrival time.
std::vector<Event> merge_event_streams(std::vector<std::vector<Event>> streams);

/// @brief Generate every process in order and merge the results.
/// @param processes  Processes to run.
/// @return Merged stream, see merge_event_streams().
/// @see generate_events
std::vector<Event> generate_all(const std::vector<Process>& processes);

} // namespace evgen::core
