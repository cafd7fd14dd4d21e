#include <tracksim/core/rule.hpp>
#include <tracksim/core/error.hpp>
#include <tracksim/core/rule_set.hpp>

#include <random>
#include <string>

namespace tracksim::core {

const Particle* RuleContext::particle(ParticleId id) const noexcept {
    auto it = particles_.find(id);
    if (it == particles_.end()) {
        return nullptr;
    }
    return &it->second;
}

const Particle* RuleContext::particle_at(Site site) const noexcept {
    auto occupant = track_.occupant_at(site);
    if (!occupant) {
        return nullptr;
    }
    return particle(*occupant);
}

bool RuleContext::has_trait(const Particle& particle, std::string_view trait_name) const noexcept {
    return rules_.has_trait(particle, trait_name);
}

bool RuleContext::site_has_trait(Site site, std::string_view trait_name) const noexcept {
    const Particle* occupant = particle_at(site);
    return occupant != nullptr && rules_.has_trait(*occupant, trait_name);
}

double RuleContext::uniform() const {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

Duration RuleContext::exponential_wait(double rate) const {
    if (!(rate > 0.0)) {
        throw RuleError("Exponential waiting time needs a positive rate, got " + std::to_string(rate));
    }
    std::exponential_distribution<double> dist(rate);
    return duration_from_seconds(dist(rng_));
}

} // namespace tracksim::core
