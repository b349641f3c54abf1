#pragma once

/// @file event_writers.hpp
/// @brief JSON and human-readable output of generated event streams.
///
/// These are export formats only: nothing in the library reads them back.
///
/// @ingroup io_writers

#include <evgen/core/event.hpp>
#include <evgen/io/metrics.hpp>

#include <ostream>
#include <vector>

namespace evgen::io {

/// @brief Write events as a JSON document.
///
/// Produces `{"events": [{"process": ..., "arrival": ..., "duration": ...}, ...]}`
/// in the order of @p events.
///
/// @param events  Events to write.
/// @param out     Output stream (file, stringstream, stdout, etc.).
void write_events_json(const std::vector<core::Event>& events, std::ostream& out);

/// @brief Write events as an aligned text table with a header row.
/// @param events  Events to write.
/// @param out     Output stream.
void write_events_text(const std::vector<core::Event>& events, std::ostream& out);

/// @brief Write per-process statistics as an aligned text table.
/// @param summaries  Output of summarize().
/// @param out        Output stream.
/// @see summarize
void write_summary_text(const std::vector<ProcessSummary>& summaries, std::ostream& out);

} // namespace evgen::io
