#pragma once

/// @file trajectory_writer.hpp
/// @brief Export of the trajectory log.
/// @ingroup io_reporting

#include <tracksim/core/trajectory.hpp>

#include <filesystem>
#include <ostream>

namespace tracksim::io {

/// @brief Write @p trajectory as a JSON array to @p out.
///
/// One object per entry, in commit order:
///
/// @code{.json}
/// [{"step": 1, "time": 1.0, "particle": 2, "from": 4, "to": 5, "kind": "move"},
///  {"step": 3, "time": 3.0, "particle": 2, "from": 6, "to": null, "kind": "expire"}]
/// @endcode
///
/// Times are in seconds. A missing site is written as null.
///
/// @ingroup io_reporting
void write_trajectory_to_stream(const core::Trajectory& trajectory, std::ostream& out);

/// @brief Write @p trajectory as JSON to the file at @p path.
/// @throws LoaderError  If the file cannot be opened.
/// @ingroup io_reporting
void write_trajectory(const core::Trajectory& trajectory, const std::filesystem::path& path);

} // namespace tracksim::io
