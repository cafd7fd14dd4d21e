#pragma once

/// @defgroup core Core Library
/// @brief Track, particles, rules, and the simulation engine.
///
/// The core library provides the foundational simulation infrastructure:
/// the Track occupancy model, Particle and trait composition, the RuleSet
/// registry with its dispatch order, and the Engine that schedules,
/// resolves and commits steps. It has no dependencies on concrete rules
/// or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for time, sites, and particle identity.

/// @defgroup core_track Track
/// @ingroup core
/// @brief Site occupancy and boundary modes.

/// @defgroup core_particles Particles
/// @ingroup core
/// @brief Particles, trait-private state, and creation specs.

/// @defgroup core_rules Rules
/// @ingroup core
/// @brief Rule signatures, actions, outcomes, and dispatch.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Scheduling loop, trajectory log, and checkpoints.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Asynchronous event types and handles.

// Convenience header for the core library
#include <tracksim/core/types.hpp>
#include <tracksim/core/error.hpp>
#include <tracksim/core/config.hpp>
#include <tracksim/core/event.hpp>
#include <tracksim/core/event_handle.hpp>
#include <tracksim/core/trace_writer.hpp>

#include <tracksim/core/track.hpp>
#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule.hpp>
#include <tracksim/core/rule_set.hpp>
#include <tracksim/core/dispatch.hpp>

#include <tracksim/core/trajectory.hpp>
#include <tracksim/core/checkpoint.hpp>
#include <tracksim/core/run_result.hpp>
#include <tracksim/core/engine.hpp>
