#include <tracksim/rules/collision_rules.hpp>
#include <tracksim/rules/standard_rules.hpp>
#include <tracksim/rules/stepping_rules.hpp>

#include <utility>

namespace tracksim::rules {

namespace {

// Wrap @p outcome so it only applies when the mover carries @p trait_name.
template<typename F>
core::CollisionRule for_mover(std::string trait_name, F outcome) {
    return [name = std::move(trait_name), outcome = std::move(outcome)](
               core::Particle& mover, const core::Particle& occupant,
               const core::RuleContext& ctx) -> core::CollisionOutcome {
        if (!ctx.has_trait(mover, name)) {
            return core::CollisionOutcome::pass();
        }
        return outcome(mover, occupant, ctx);
    };
}

} // namespace

bool is_track_end(const core::Particle& occupant, const core::RuleContext& ctx) noexcept {
    return ctx.has_trait(occupant, TRACK_END);
}

core::CollisionRule reflect(std::string trait_name) {
    return for_mover(std::move(trait_name),
                     [](core::Particle& mover, const core::Particle&, const core::RuleContext& ctx) {
                         mover.set(DIRECTION, -direction_of(mover, ctx));
                         return core::CollisionOutcome::blocked();
                     });
}

core::CollisionRule kick_off(std::string trait_name) {
    return for_mover(std::move(trait_name),
                     [](core::Particle&, const core::Particle& occupant, const core::RuleContext& ctx) {
                         if (is_track_end(occupant, ctx)) {
                             return core::CollisionOutcome::blocked();
                         }
                         return core::CollisionOutcome::merge(core::Survivor::Mover);
                     });
}

core::CollisionRule fall_off(std::string trait_name) {
    return for_mover(std::move(trait_name),
                     [](core::Particle&, const core::Particle&, const core::RuleContext&) {
                         return core::CollisionOutcome::merge(core::Survivor::Occupant);
                     });
}

core::CollisionRule push(std::string trait_name) {
    return for_mover(std::move(trait_name),
                     [](core::Particle&, const core::Particle& occupant, const core::RuleContext& ctx) {
                         if (is_track_end(occupant, ctx)) {
                             return core::CollisionOutcome::blocked();
                         }
                         return core::CollisionOutcome::push();
                     });
}

core::CollisionRule swap(std::string trait_name) {
    return for_mover(std::move(trait_name),
                     [](core::Particle&, const core::Particle& occupant, const core::RuleContext& ctx) {
                         if (is_track_end(occupant, ctx)) {
                             return core::CollisionOutcome::blocked();
                         }
                         return core::CollisionOutcome::swap();
                     });
}

} // namespace tracksim::rules
