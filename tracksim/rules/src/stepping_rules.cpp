#include <tracksim/rules/stepping_rules.hpp>

#include <tracksim/core/error.hpp>

#include <string>

namespace tracksim::rules {

int64_t direction_of(core::Particle& self, const core::RuleContext& ctx) {
    if (!self.has(DIRECTION)) {
        int64_t drawn = ctx.uniform() < 0.5 ? -1 : 1;
        self.set(DIRECTION, drawn);
        return drawn;
    }
    auto direction = self.get<int64_t>(DIRECTION);
    if (direction != -1 && direction != 1) {
        throw core::RuleError("Particle " + std::to_string(self.id().value) +
                              " has direction " + std::to_string(direction) +
                              ", expected -1 or 1");
    }
    return direction;
}

core::Duration step_interval(const core::Particle& self) {
    double speed = self.get_or<double>(SPEED, 1.0);
    if (speed <= 0.0) {
        throw core::RuleError("Particle " + std::to_string(self.id().value) +
                              " has non-positive speed " + std::to_string(speed));
    }
    return core::duration_from_seconds(1.0 / speed);
}

core::StepAction walker_step(core::Particle& self, const core::RuleContext& ctx) {
    core::Site target = self.position() + direction_of(self, ctx);
    return core::StepAction::move_to(target).with_wait(step_interval(self));
}

core::StepAction random_walker_step(core::Particle& self, const core::RuleContext& ctx) {
    double p_forward = self.get_or<double>(P_FORWARD, 0.5);
    if (p_forward < 0.0 || p_forward > 1.0) {
        throw core::RuleError("Particle " + std::to_string(self.id().value) +
                              " has p_forward " + std::to_string(p_forward) +
                              " outside [0, 1]");
    }
    int64_t direction = direction_of(self, ctx);
    if (ctx.uniform() >= p_forward) {
        direction = -direction;
    }
    return core::StepAction::move_to(self.position() + direction).with_wait(step_interval(self));
}

} // namespace tracksim::rules
