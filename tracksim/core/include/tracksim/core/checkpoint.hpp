#pragma once

#include <tracksim/core/config.hpp>
#include <tracksim/core/event.hpp>
#include <tracksim/core/particle.hpp>
#include <tracksim/core/track.hpp>
#include <tracksim/core/trajectory.hpp>
#include <tracksim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tracksim::core {

/// @brief Saved form of one particle. Traits are stored by name.
/// @ingroup core_engine
struct ParticleRecord {
    ParticleId id;
    Site position{0};
    std::vector<std::string> traits;
    StateMap state;
    TimePoint created_at;
};

/// @brief A queued asynchronous event together with its ordering key.
/// @ingroup core_engine
struct PendingEvent {
    EventKey key;
    Event event;
};

/// @brief Complete resumable state of an Engine.
///
/// Produced by Engine::checkpoint() and consumed by Engine::restore().
/// Restoring into an engine built with the same track geometry, scheduling
/// policy and rule set continues the run exactly as if it had never been
/// interrupted: same particle ids, same event order, same random draws.
///
/// Rules themselves are code and are not part of a checkpoint.
///
/// @see Engine::checkpoint, Engine::restore
/// @ingroup core_engine
struct Checkpoint {
    std::size_t track_length{0};
    BoundaryMode boundary{BoundaryMode::Closed};
    SchedulingPolicy policy{SchedulingPolicy::Synchronous};
    bool finalized{false};
    uint64_t step{0};
    TimePoint time;
    uint64_t next_id{0};
    uint64_t sequence{0};
    std::string rng_state;                 ///< Textual state of the random engine.
    std::vector<ParticleRecord> particles; ///< In ascending id order.
    std::vector<PendingEvent> pending;     ///< In queue order.
    Trajectory trajectory;
};

} // namespace tracksim::core
