#pragma once

/// @file scenario_loader.hpp
/// @brief Functions and data structures for loading and writing JSON scenario files.
/// @ingroup io_loaders

#include <tracksim/core/config.hpp>
#include <tracksim/core/engine.hpp>
#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule_set.hpp>
#include <tracksim/core/track.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

namespace tracksim::io {

/// @brief Geometry of the track.
///
/// @ingroup io_loaders
struct TrackParams {
    std::size_t length{0};                                 ///< Number of sites.
    core::BoundaryMode boundary{core::BoundaryMode::Marked}; ///< Defaults to marked ends.
};

/// @brief Complete scenario definition: track, engine settings and initial particles.
///
/// Loaded from JSON via @ref load_scenario:
///
/// @code{.json}
/// {
///   "track": {"length": 100, "boundary": "marked"},
///   "engine": {"policy": "synchronous", "seed": 42, "tick_length": 1.0,
///              "max_ticks": 500, "max_time": 0},
///   "particles": [
///     {"position": 10, "traits": ["walker"], "state": {"direction": 1}},
///     {"traits": ["random_walker", "finite_life"], "state": {"lifetime": 30.0}}
///   ]
/// }
/// @endcode
///
/// Every `engine` member is optional. A `max_ticks` or `max_time` of zero
/// means no limit. Integral state values load as integers and any other
/// number as floating point.
///
/// @ingroup io_loaders
/// @see load_scenario, build_engine
struct ScenarioData {
    TrackParams track;
    core::EngineConfig engine;
    std::vector<core::ParticleSpec> particles; ///< In creation order.
};

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
///
/// @see load_scenario_from_string
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

/// @brief Write a scenario to a JSON file.
/// @see write_scenario_to_stream
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario to an output stream in the format load_scenario() reads.
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

/// @brief Build an engine for @p scenario and register its particles.
///
/// The engine is heap-allocated because core::Engine is non-movable.
///
/// @param scenario  Loaded scenario.
/// @param rules     Rule set declaring every trait the particles use.
///
/// @throws core::ConfigurationError  On an invalid engine configuration or
///         a particle naming an undeclared trait.
/// @throws core::OccupiedError, core::OutOfRangeError  On a bad position.
std::unique_ptr<core::Engine> build_engine(const ScenarioData& scenario, core::RuleSet rules);

} // namespace tracksim::io
