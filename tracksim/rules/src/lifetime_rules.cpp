#include <tracksim/rules/lifetime_rules.hpp>

#include <tracksim/core/error.hpp>

#include <string>

namespace tracksim::rules {

std::optional<core::TimePoint> finite_life_expiry(const core::Particle& self,
                                                  const core::RuleContext& /*ctx*/) {
    if (!self.has(LIFETIME)) {
        return std::nullopt;
    }
    double lifetime = self.get<double>(LIFETIME);
    if (lifetime < 0.0) {
        throw core::RuleError("Particle " + std::to_string(self.id().value) +
                              " has negative lifetime " + std::to_string(lifetime));
    }
    return self.created_at() + core::duration_from_seconds(lifetime);
}

} // namespace tracksim::rules
