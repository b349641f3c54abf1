#pragma once

/// @defgroup core Core Library
/// @brief Arrival models, events and random-variate sampling.
///
/// The core library turns process definitions into event sequences. It
/// performs no I/O and has no third-party dependencies.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event values, scheduler timing slots, and stream merging.

/// @defgroup core_sampling Sampling
/// @ingroup core
/// @brief Variate sources and the exponential sampler.

/// @defgroup core_processes Processes
/// @ingroup core
/// @brief Singleton, periodic and stochastic renewal generators.

// Convenience header for the core library
#include <evgen/core/error.hpp>
#include <evgen/core/event.hpp>
#include <evgen/core/checks.hpp>
#include <evgen/core/sampler.hpp>

#include <evgen/core/singleton_process.hpp>
#include <evgen/core/periodic_process.hpp>
#include <evgen/core/stochastic_process.hpp>
#include <evgen/core/process.hpp>
#include <evgen/core/event_stream.hpp>
