#pragma once

/// @file collision_rules.hpp
/// @brief Stock collision responses.
/// @ingroup rules_collision
///
/// Each factory returns a core::CollisionRule that speaks only for the
/// mover: it answers when the mover carries @p trait_name (the trait the
/// rule is bound to) and passes otherwise, so a particle running into a
/// `kick_off` particle is not kicked off itself. None of them displaces or
/// removes a `track_end` marker; they answer blocked instead.

#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule.hpp>

#include <string>

namespace tracksim::rules {

/// @brief The mover turns around (its direction is negated) and stays.
/// @ingroup rules_collision
[[nodiscard]] core::CollisionRule reflect(std::string trait_name);

/// @brief The mover removes the occupant and takes its site.
/// @ingroup rules_collision
[[nodiscard]] core::CollisionRule kick_off(std::string trait_name);

/// @brief The mover is removed; the occupant is unaffected.
/// @ingroup rules_collision
[[nodiscard]] core::CollisionRule fall_off(std::string trait_name);

/// @brief The mover pushes the occupant (and any train behind it) one site on.
/// @ingroup rules_collision
[[nodiscard]] core::CollisionRule push(std::string trait_name);

/// @brief Mover and occupant exchange sites.
/// @ingroup rules_collision
[[nodiscard]] core::CollisionRule swap(std::string trait_name);

/// @brief True if @p occupant is a `track_end` marker.
/// @ingroup rules_collision
[[nodiscard]] bool is_track_end(const core::Particle& occupant, const core::RuleContext& ctx) noexcept;

} // namespace tracksim::rules
