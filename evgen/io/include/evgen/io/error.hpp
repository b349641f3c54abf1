#pragma once

/// @file error.hpp
/// @brief Errors raised while loading process configuration.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace evgen::io {

/// @brief A process configuration could not be turned into processes.
///
/// Raised for unreadable files, JSON syntax errors, missing or mistyped
/// fields, unknown process types, repeated process names, and parameters
/// that a process constructor refuses. The message names the offending
/// `processes[i]` entry when there is one.
///
/// @ingroup io
/// @see load_processes, core::InvalidParameterError
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Build the message as `"<where>: <what went wrong>"`.
    /// @param message  What is wrong with the configuration.
    /// @param context  Where: a file path, `config`, or a `processes[i]` entry.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace evgen::io
