#pragma once

#include <tracksim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace tracksim::core {

/// @brief Kind of committed change recorded in the trajectory log.
/// @ingroup core_engine
enum class EventKind {
    Place,  ///< Registered at setup.
    Move,   ///< Moved to an adjacent empty site.
    Swap,   ///< Exchanged sites with a neighbour.
    Push,   ///< Displaced by a pushing neighbour.
    Bounce, ///< Redirected by a collision rule.
    Merge,  ///< Took part in a merge (the absorbed party has no new site).
    Remove, ///< Removed on its own request.
    Expire, ///< Removed because its lifetime ran out.
    Exit,   ///< Left an open track end.
    Spawn,  ///< Created by a rule during the run.
};

/// @brief Return the lowercase name of an event kind ("move", "swap", ...).
[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;

/// @brief Parse an event kind name.
/// @return The kind, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<EventKind> event_kind_from_string(std::string_view name) noexcept;

/// @brief One committed change to a particle.
///
/// `from` is empty for particles that appear (place, spawn) and `to` is
/// empty for particles that disappear (remove, expire, exit, absorbed
/// merge party).
///
/// @ingroup core_engine
struct TrajectoryEntry {
    uint64_t step{0};
    TimePoint time;
    ParticleId particle;
    std::optional<Site> from;
    std::optional<Site> to;
    EventKind kind{EventKind::Move};

    bool operator==(const TrajectoryEntry&) const = default;
};

/// @brief Append-only log of committed changes, in commit order.
/// @ingroup core_engine
using Trajectory = std::vector<TrajectoryEntry>;

} // namespace tracksim::core
