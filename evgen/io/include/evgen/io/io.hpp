#pragma once

/// @defgroup io I/O Library
/// @brief JSON configuration loading, event output, and stream statistics.
///
/// The I/O library handles all external data formats: loading process
/// definitions from JSON, writing generated events as JSON or text, and
/// computing per-process statistics. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Process configuration loader.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief JSON and textual event writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Per-process statistics over event streams.

// Convenience header for the I/O library

#include <evgen/io/error.hpp>
#include <evgen/io/process_loader.hpp>
#include <evgen/io/event_writers.hpp>
#include <evgen/io/metrics.hpp>
