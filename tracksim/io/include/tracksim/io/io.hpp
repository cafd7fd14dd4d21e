#pragma once

/// @defgroup io I/O Library
/// @brief JSON scenarios, checkpoints, trace output, and trajectory export.
///
/// The I/O library handles all external data formats: loading scenario
/// JSON files into an engine, saving and restoring checkpoints, writing
/// simulation traces (JSON, textual, in-memory), exporting the trajectory
/// log, and sampling particle positions during a run.
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario and checkpoint JSON readers and writers.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_reporting Reporting
/// @ingroup io
/// @brief Trajectory export and position sampling.

// Convenience header for libtracksim-io

#include <tracksim/io/checkpoint_io.hpp>
#include <tracksim/io/error.hpp>
#include <tracksim/io/scenario_loader.hpp>
#include <tracksim/io/snapshot_recorder.hpp>
#include <tracksim/io/trace_writers.hpp>
#include <tracksim/io/trajectory_writer.hpp>
