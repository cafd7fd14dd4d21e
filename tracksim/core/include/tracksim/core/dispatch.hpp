#pragma once

#include <tracksim/core/particle.hpp>
#include <tracksim/core/rule.hpp>
#include <tracksim/core/rule_set.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace tracksim::core {

/// @brief Where a dispatched decision came from.
/// @ingroup core_rules
enum class DecisionSource {
    Trait,    ///< A handler of an attached trait answered.
    Fallback, ///< Every trait passed; the global fallback answered.
    Default,  ///< Nobody answered; the built-in default applies.
};

/// @brief Return the lowercase name of a decision source.
[[nodiscard]] std::string_view to_string(DecisionSource source) noexcept;

/// @brief A dispatched rule result together with its provenance.
/// @ingroup core_rules
template<typename R>
struct Decision {
    R result;
    DecisionSource source{DecisionSource::Default};
    std::optional<TraitId> trait; ///< Set when source is DecisionSource::Trait.
};

/// @brief Ask @p self's stepping handlers, in attachment order, what to do.
///
/// Falls back to the global stepping rule, then to StepAction::stay().
/// A default decision carries DecisionSource::Default so that the
/// asynchronous scheduler can tell "no rule at all" apart from an
/// explicit stay.
///
/// @ingroup core_rules
[[nodiscard]] Decision<StepAction> dispatch_step(const RuleSet& rules, Particle& self,
                                                 const RuleContext& ctx);

/// @brief Resolve a move of @p mover onto @p occupant's site.
///
/// Precedence: the mover's traits in attachment order, then the
/// occupant's traits in attachment order, then the global fallback
/// collision rule, then CollisionOutcome::blocked().
///
/// @ingroup core_rules
[[nodiscard]] Decision<CollisionOutcome> dispatch_collision(const RuleSet& rules, Particle& mover,
                                                            const Particle& occupant,
                                                            const RuleContext& ctx);

/// @brief First expiry time reported by @p self's lifetime handlers, if any.
/// @ingroup core_rules
[[nodiscard]] std::optional<TimePoint> dispatch_lifetime(const RuleSet& rules, const Particle& self,
                                                         const RuleContext& ctx);

/// @brief Spawn requests from the first removal handler that answers.
/// @return An empty list when every handler passes.
/// @ingroup core_rules
[[nodiscard]] std::vector<ParticleSpec> dispatch_removal(const RuleSet& rules, const Particle& self,
                                                         const RuleContext& ctx);

} // namespace tracksim::core
