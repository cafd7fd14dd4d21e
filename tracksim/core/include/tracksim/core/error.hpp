#pragma once

#include <stdexcept>
#include <string>

namespace tracksim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions. Exceptions raised by
/// user rules are not wrapped; they reach the caller unchanged.
///
/// @see ConfigurationError, RuleError, BoundaryError, InvariantViolation
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when trait or rule registration is contradictory or incomplete.
///
/// Detected during setup (RuleSet binding, Engine::add_particle,
/// Engine::finalize), always before the first step executes.
///
/// @see RuleSet, Engine::finalize
/// @ingroup core
class ConfigurationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a rule returns a value outside its contract.
///
/// For example a move to a non-adjacent site, or a missing waiting time
/// under asynchronous scheduling. The step that produced it is abandoned
/// and the engine finishes.
///
/// @see StepAction, CollisionOutcome
/// @ingroup core
class RuleError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a move leaves a marker-bounded track.
///
/// On a marked track the end markers are expected to intercept every
/// move toward the edge. A move that still targets a site outside the
/// track means a rule displaced or removed a marker. Fatal; never retried.
///
/// @see BoundaryMode::Marked
/// @ingroup core
class BoundaryError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when track occupancy and particle positions disagree.
///
/// Signals an engine defect or a corrupt checkpoint. Checked after every
/// commit when EngineConfig::check_invariants is set, and on every
/// Engine::restore. Fatal; never suppressed.
///
/// @ingroup core
class InvariantViolation : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when placing a particle on a site that is already occupied.
///
/// @see Track::place
/// @ingroup core
class OccupiedError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example stepping an engine that has finished, or registering a
/// particle after the first step.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example a direct Track call with a site outside the track, or an
/// unknown particle id.
///
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace tracksim::core
