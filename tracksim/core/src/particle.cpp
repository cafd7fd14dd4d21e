#include <tracksim/core/particle.hpp>
#include <tracksim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace tracksim::core {

Particle::Particle(ParticleId id, Site position, std::vector<TraitId> traits, StateMap state,
                   TimePoint created_at)
    : id_(id)
    , position_(position)
    , traits_(std::move(traits))
    , state_(std::move(state))
    , created_at_(created_at) {}

bool Particle::has_trait(TraitId trait) const noexcept {
    return std::find(traits_.begin(), traits_.end(), trait) != traits_.end();
}

bool Particle::has(std::string_view key) const noexcept {
    return state_.find(key) != state_.end();
}

void Particle::set(std::string_view key, StateValue value) {
    auto it = state_.find(key);
    if (it != state_.end()) {
        it->second = std::move(value);
    } else {
        state_.emplace(std::string(key), std::move(value));
    }
}

void Particle::erase(std::string_view key) {
    auto it = state_.find(key);
    if (it != state_.end()) {
        state_.erase(it);
    }
}

void Particle::throw_missing(std::string_view key) const {
    throw OutOfRangeError("Particle " + std::to_string(id_.value) + " has no state '" +
                          std::string(key) + "'");
}

void Particle::throw_type_mismatch(std::string_view key) const {
    throw InvalidStateError("Particle " + std::to_string(id_.value) + " state '" +
                            std::string(key) + "' has a different type");
}

} // namespace tracksim::core
