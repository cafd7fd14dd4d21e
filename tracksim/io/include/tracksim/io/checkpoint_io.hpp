#pragma once

/// @file checkpoint_io.hpp
/// @brief JSON serialisation of engine checkpoints.
/// @ingroup io_loaders
///
/// Times are stored as integer nanoseconds and the random engine state as
/// its textual form, so a checkpoint read back restores a run exactly.
/// Trait names, not ids, identify traits; the rule set that restores a
/// checkpoint must declare every trait named in it.

#include <tracksim/core/checkpoint.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace tracksim::io {

/// @brief Format version written by write_checkpoint().
inline constexpr uint64_t CHECKPOINT_FORMAT_VERSION = 1;

/// @brief Serialise @p checkpoint as JSON to @p out.
/// @ingroup io_loaders
void write_checkpoint_to_stream(const core::Checkpoint& checkpoint, std::ostream& out);

/// @brief Serialise @p checkpoint as JSON to the file at @p path.
/// @throws LoaderError  If the file cannot be opened.
/// @ingroup io_loaders
void write_checkpoint(const core::Checkpoint& checkpoint, const std::filesystem::path& path);

/// @brief Serialise @p checkpoint to a JSON string.
/// @ingroup io_loaders
[[nodiscard]] std::string checkpoint_to_string(const core::Checkpoint& checkpoint);

/// @brief Parse a checkpoint from JSON.
/// @throws LoaderError  If the JSON is malformed, a field is missing, or the
///         format version is not supported.
/// @ingroup io_loaders
core::Checkpoint read_checkpoint_from_string(std::string_view json);

/// @brief Parse a checkpoint from the file at @p path.
/// @throws LoaderError  If the file cannot be read or its content is invalid.
/// @ingroup io_loaders
core::Checkpoint read_checkpoint(const std::filesystem::path& path);

} // namespace tracksim::io
