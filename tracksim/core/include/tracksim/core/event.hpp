#pragma once

#include <tracksim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <variant>

namespace tracksim::core {

/// @brief Deterministic ordering key for events in the asynchronous queue.
///
/// Events are ordered first by simulation time, then by priority
/// (lower values fire first), then by insertion sequence number to
/// guarantee determinism when time and priority are equal.
///
/// @see EventPriority, Engine
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    int priority;        ///< Secondary: lower values fire first within a timestep.
    uint64_t sequence;   ///< Tertiary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief Named constants for event dispatch priority.
///
/// Lower numeric values fire first within the same simulation time, so a
/// particle whose lifetime ends at time t is gone before anything steps
/// at t.
///
/// @see EventKey
/// @ingroup core_events
struct EventPriority {
    static constexpr int EXPIRY = -100; ///< Lifetime check.
    static constexpr int STEP   = 0;    ///< Stepping opportunity.
};

/// @brief A particle's next stepping opportunity.
/// @ingroup core_events
struct StepEvent {
    ParticleId particle;
};

/// @brief A particle's lifetime may have run out.
///
/// The lifetime rule is queried again when the event fires, so state
/// changes made since scheduling are honoured.
///
/// @ingroup core_events
struct ExpiryEvent {
    ParticleId particle;
};

/// @brief Variant holding all event types of the asynchronous scheduler.
/// @ingroup core_events
using Event = std::variant<StepEvent, ExpiryEvent>;

} // namespace tracksim::core
