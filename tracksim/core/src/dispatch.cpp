#include <tracksim/core/dispatch.hpp>

#include <initializer_list>
#include <utility>

namespace tracksim::core {

std::string_view to_string(DecisionSource source) noexcept {
    switch (source) {
        case DecisionSource::Trait:    return "trait";
        case DecisionSource::Fallback: return "fallback";
        case DecisionSource::Default:  return "default";
    }
    return "unknown";
}

Decision<StepAction> dispatch_step(const RuleSet& rules, Particle& self, const RuleContext& ctx) {
    for (TraitId id : self.traits()) {
        const Trait& trait = rules.trait(id);
        if (!trait.stepping) {
            continue;
        }
        StepAction action = trait.stepping(self, ctx);
        if (action.is_definite()) {
            return {std::move(action), DecisionSource::Trait, id};
        }
    }
    if (const auto& fallback = rules.fallback_stepping()) {
        StepAction action = fallback(self, ctx);
        if (action.is_definite()) {
            return {std::move(action), DecisionSource::Fallback, std::nullopt};
        }
    }
    return {StepAction::stay(), DecisionSource::Default, std::nullopt};
}

Decision<CollisionOutcome> dispatch_collision(const RuleSet& rules, Particle& mover,
                                              const Particle& occupant, const RuleContext& ctx) {
    for (const Particle* party : std::initializer_list<const Particle*>{&mover, &occupant}) {
        for (TraitId id : party->traits()) {
            const Trait& trait = rules.trait(id);
            if (!trait.collision) {
                continue;
            }
            CollisionOutcome outcome = trait.collision(mover, occupant, ctx);
            if (outcome.is_definite()) {
                return {outcome, DecisionSource::Trait, id};
            }
        }
    }
    if (const auto& fallback = rules.fallback_collision()) {
        CollisionOutcome outcome = fallback(mover, occupant, ctx);
        if (outcome.is_definite()) {
            return {outcome, DecisionSource::Fallback, std::nullopt};
        }
    }
    return {CollisionOutcome::blocked(), DecisionSource::Default, std::nullopt};
}

std::optional<TimePoint> dispatch_lifetime(const RuleSet& rules, const Particle& self,
                                           const RuleContext& ctx) {
    for (TraitId id : self.traits()) {
        const Trait& trait = rules.trait(id);
        if (!trait.lifetime) {
            continue;
        }
        if (auto expiry = trait.lifetime(self, ctx)) {
            return expiry;
        }
    }
    return std::nullopt;
}

std::vector<ParticleSpec> dispatch_removal(const RuleSet& rules, const Particle& self,
                                           const RuleContext& ctx) {
    for (TraitId id : self.traits()) {
        const Trait& trait = rules.trait(id);
        if (!trait.removal) {
            continue;
        }
        if (auto spawns = trait.removal(self, ctx)) {
            return std::move(*spawns);
        }
    }
    return {};
}

} // namespace tracksim::core
