#pragma once

/// @file checks.hpp
/// @brief Parameter checks shared by every process and sampler constructor.
/// @ingroup core

#include <evgen/core/event.hpp>

namespace evgen::core {

/// @brief Reject negative times, durations and counts.
/// @param value    Value to check.
/// @param context  Parameter name used in the error message.
/// @throws InvalidParameterError  If @p value < 0.
void require_non_negative(Tick value, const char* context);

/// @brief Reject means that cannot parameterise an exponential distribution.
/// @param mean     Value to check.
/// @param context  Parameter name used in the error message.
/// @throws InvalidParameterError  If @p mean is not finite or not positive.
void require_positive_mean(double mean, const char* context);

} // namespace evgen::core
