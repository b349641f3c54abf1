#pragma once

/// @file process_loader.hpp
/// @brief Loading process definitions from JSON configuration.
/// @ingroup io_loaders

#include <evgen/core/process.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace evgen::io {

/// @brief Load process definitions from a JSON file.
///
/// The root object holds a `processes` array; each entry has a `name`, a
/// `type` of `singleton`, `periodic` or `stochastic`, and the parameters of
/// that model:
///
/// - singleton: `duration`, `arrival`
/// - periodic: `duration`, `interarrival_time`, `first_arrival`, `num_repetitions`
/// - stochastic: `mean_duration`, `mean_interarrival_time`, `first_arrival`,
///   `end_time`, optional `seed`
///
/// @param path       Filesystem path to the JSON configuration.
/// @param base_seed  Seed used to derive seeds for stochastic entries that
///                   have none; when absent those entries stay unseeded.
/// @return Processes in file order.
///
/// @throws LoaderError  If the file cannot be read or the configuration is invalid.
///
/// @see load_processes_from_string
std::vector<core::Process> load_processes(const std::filesystem::path& path,
                                          std::optional<std::uint64_t> base_seed = std::nullopt);

/// @brief Load process definitions from a JSON string.
///
/// @param json       JSON content, see load_processes().
/// @param base_seed  Seed used to derive seeds for unseeded stochastic entries.
/// @return Processes in document order.
///
/// @throws LoaderError  If the JSON is malformed, a field is missing or has
///                      the wrong type, the type is unknown, a name is
///                      repeated, or a process rejects its parameters.
std::vector<core::Process> load_processes_from_string(
    std::string_view json,
    std::optional<std::uint64_t> base_seed = std::nullopt);

} // namespace evgen::io
