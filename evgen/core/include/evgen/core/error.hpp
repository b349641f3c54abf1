#pragma once

#include <stdexcept>
#include <string>

namespace evgen::core {

/// @brief Base exception for all event-generation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch generation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidParameterError, SamplerError
/// @ingroup core
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a process or sampler is constructed with invalid parameters.
///
/// Every constructor applies the same policy: times and durations must be
/// non-negative, repetition counts must be non-negative, and distribution
/// means must be finite and strictly positive.
///
/// @see GenerationError
/// @ingroup core
class InvalidParameterError : public GenerationError {
public:
    using GenerationError::GenerationError;
};

/// @brief Thrown when a variate source produces a negative or NaN sample.
///
/// ExponentialSampler never does; this guards injected sources.
///
/// @see VariateSource, generate_renewal_events
/// @ingroup core
class SamplerError : public GenerationError {
public:
    using GenerationError::GenerationError;
};

} // namespace evgen::core
