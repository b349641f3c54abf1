#pragma once

/// @file process.hpp
/// @brief The closed set of arrival models and their common dispatch.
/// @ingroup core_processes

#include <evgen/core/event.hpp>
#include <evgen/core/periodic_process.hpp>
#include <evgen/core/singleton_process.hpp>
#include <evgen/core/stochastic_process.hpp>

#include <string>
#include <variant>
#include <vector>

namespace evgen::core {

/// @brief Any arrival model: single-shot, periodic or stochastic renewal.
///
/// The set of models is closed; callers dispatch through generate_events()
/// and process_name() rather than inspecting the alternative.
///
/// @ingroup core_processes
using Process = std::variant<SingletonProcess, PeriodicProcess, StochasticProcess>;

/// @brief Generate the events of @p process.
///
/// Every returned event carries the process name. The result is a fresh
/// value collection; later calls never alter it.
///
/// @param process  Process to generate from.
/// @return Finite sequence of events in emission order.
[[nodiscard]] std::vector<Event> generate_events(const Process& process);

/// @brief Get the name of @p process, whatever its model.
[[nodiscard]] const std::string& process_name(const Process& process);

} // namespace evgen::core
